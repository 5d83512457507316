#include "diagnostic.hxx"

// cells may be forced from several threads, each keeps its own nesting
thread_local int lazylist::Say::indent = 0;

extern "C" void dbgbrk() {
}

namespace {
  // one write per report so lines from concurrent threads do not interleave
  void report(const char *head, const char *file, int line, const char *msg) {
    std::stringstream ss;
    ss << head;
    if(msg)
      ss << msg << ' ';
    ss << "(see " << file << ':' << line << ").\n";
    std::cerr << ss.str();
    std::cerr.flush();
  }
}

void lazylist::user_error(const char *file, int line, const char *msg) {
  report("USER ERROR: ", file, line, msg);
  dbgbrk();
  std::abort();
}

void lazylist::dev_error(const char *file, int line, const char *msg) {
  report("BUG! ", file, line, msg);
  dbgbrk();
  std::abort();
}
