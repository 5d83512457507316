#ifndef _15534581_29e5_47cd_ac29_e0712447c049
#define _15534581_29e5_47cd_ac29_e0712447c049

# include "knobs.hxx"

# include <cstdlib>
# include <iostream>
# include <sstream>

extern "C" void dbgbrk();

namespace lazylist {
  void user_error(const char *file, int line, const char *msg);
  void dev_error(const char *file, int line, const char *msg=0x0);

# define DEV_ERROR(msg) ::lazylist::dev_error(__FILE__, __LINE__, msg)

# define USER_ASSERT_F(ok,msg) \
do {\
  if(!(ok)) {\
    ::std::stringstream ss;\
    ss << msg;\
    ::lazylist::user_error(__FILE__, __LINE__, ss.str().c_str());\
  }\
} while(0)

#  define HARD_ASSERT(ok) \
do {\
  if(!(ok)) ::lazylist::dev_error(__FILE__, __LINE__, #ok);\
} while(0)

# if KNOB_DEV_ASSERT
#  define DEV_ASSERT(ok) HARD_ASSERT(ok)
# else
#  define DEV_ASSERT(ok)
# endif

# define SAY(yep,msg) \
do { \
  if(yep) ::lazylist::Say() << msg; \
} while(0)

  // writes a line to stderr atomically
  // usage:
  //   Say() << "hello" << ' ' << "world"; // ending newline implied
  //   Say(+1) << "begin";  // this line, then everything after, indented
  //   Say(-1) << "end";    // back out, this line included
  class Say {
    std::stringstream ss;
  public:
    static thread_local int indent;

    Say(int indent_more=0) {
      if(indent_more < 0)
        indent += indent_more;
      for(int i=0; i < 2*indent; i++)
        ss << ' ';
      if(indent_more > 0)
        indent += indent_more;
    }
    ~Say() {
      ss << '\n';
      std::cerr << ss.str();
      std::cerr.flush();
    }

    template<class T>
    Say& operator<<(const T &x) {
      ss << x;
      return *this;
    }
  };
}
#endif
