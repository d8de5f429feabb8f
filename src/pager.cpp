#include "pager.hpp"
#include <algorithm>
#include <vector>
#include "layout.hpp"

int progress_percent(size_t consumed, size_t total) {
  if (total == 0 || consumed >= total) return 100;
  unsigned long long num = static_cast<unsigned long long>(consumed) * 200 + total;
  int pct = static_cast<int>(num / (2ull * total));
  return std::min(pct, 99);
}

Pager::Pager(ITerminal& term, const PagerOptions& opts) : term_(term), opts_(opts) {}

bool Pager::open(const std::filesystem::path& path, Document& doc, Error& err) {
  if (doc.open(path, err.msg)) return true;
  err.kind = ErrorKind::File;
  return false;
}

bool Pager::init_terminal(TerminalSession& ts, Viewport& vp, Error& err) {
  if (!ts.open(err.msg)) {
    err.kind = ErrorKind::Terminal;
    return false;
  }
  return measure(vp, err);
}

bool Pager::measure(Viewport& vp, Error& err) const {
  if (compute_viewport(term_.getSize(), opts_.padding, vp, err.msg)) return true;
  err.kind = ErrorKind::ViewportTooSmall;
  return false;
}

bool Pager::render_next_page(Document& doc, Session& s, const Viewport& vp, Error& err) {
  // past the end there is nothing left to read; keep the last page on screen
  if (s.at_eof && s.pages > 0) return true;
  std::vector<std::string> rows;
  if (!doc.read_rows(vp.height, vp.width, opts_.tab_width, rows, err.msg)) {
    err.kind = ErrorKind::File;
    return false;
  }
  s.page = std::move(rows);
  s.offset = doc.offset();
  s.at_eof = doc.at_eof();
  s.progress = std::max(s.progress, progress_percent(doc.offset(), doc.size()));
  s.pages++;
  renderer_.render(term_, vp, s, opts_.show_hint);
  s.message.clear();
  return true;
}

void Pager::redraw(const Session& s, const Viewport& vp) {
  renderer_.render(term_, vp, s, opts_.show_hint);
}

Command Pager::wait_for_command() {
  return input_.map_key(term_.read_key());
}

bool Pager::run(const std::filesystem::path& path, Error& err) {
  Document doc;
  if (!open(path, doc, err)) return false;
  TerminalSession ts(term_);
  Viewport vp;
  if (!init_terminal(ts, vp, err)) return false;

  Session s;
  s.message = startup_message_;
  if (!render_next_page(doc, s, vp, err)) return false;
  while (!s.done) {
    switch (wait_for_command()) {
      case Command::Quit:
        s.done = true;
        break;
      case Command::Redraw:
        if (!measure(vp, err)) return false;
        redraw(s, vp);
        break;
      case Command::Advance:
        if (s.at_eof) {
          if (opts_.quit_at_eof) s.done = true;
          break;
        }
        if (!render_next_page(doc, s, vp, err)) return false;
        break;
    }
  }
  return true;
}
