#pragma once
/*
 * Input
 *
 * Purpose: turn a raw key code into a pager Command.
 * Note: q/Q quit; resize redraws; everything else advances one page.
 */

#include "types.hpp"

class Input {
public:
  Command map_key(int ch) const;
};
