#include "lowlevel/lazy.hxx"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace lazylist;
using namespace std;

struct Poo {
  static int live;
  int x;
  Poo(int x): x(x) { live++; }
  ~Poo() { live--; }
};
int Poo::live = 0;

string show(const Lazy<int> &x) {
  stringstream ss;
  ss << x;
  return ss.str();
}

int main() {
  {
    int calls = 0;
    Lazy<int> x([&](void *p) { calls++; ::new(p) int(42); });
    HARD_ASSERT(calls == 0);
    HARD_ASSERT(!x.is_forced() && x.peek() == nullptr);
    HARD_ASSERT(show(x) == "<pending>");

    const int *a = x.force();
    const int *b = x.force();
    const int *c = x.force();
    cout << "x=" << *a << " calls=" << calls << '\n';
    HARD_ASSERT(*a == 42);
    HARD_ASSERT(a == b && b == c);
    HARD_ASSERT(calls == 1);
    HARD_ASSERT(x.is_forced() && x.peek() == a);
    HARD_ASSERT(show(x) == "42");
  }

  // the producer asks for its own value
  {
    Lazy<int> x;
    const int *reentered = reinterpret_cast<const int*>(0x1);
    LazyState seen = lazy_pending;
    x.bind([&](void *p) {
      seen = x.state();
      reentered = x.force();
      ::new(p) int(7);
    });
    HARD_ASSERT(*x.force() == 7);
    cout << "reentered=" << reentered << '\n';
    HARD_ASSERT(reentered == nullptr);
    HARD_ASSERT(seen == lazy_busy);
    HARD_ASSERT(x.state() == lazy_done);
  }

  // producer throws
  {
    int calls = 0;
    Lazy<int> x([&](void *p) {
      calls++;
      throw runtime_error("no value today");
    });
    bool caught = false;
    try {
      x.force();
    }
    catch(const runtime_error &e) {
      cout << "caught: " << e.what() << '\n';
      caught = true;
    }
    HARD_ASSERT(caught);
    HARD_ASSERT(calls == 1);
    HARD_ASSERT(x.is_poisoned() && !x.is_forced());
    HARD_ASSERT(x.state() == lazy_poisoned);
    HARD_ASSERT(show(x) == "<poisoned>");
  }

  // values made without a producer, and destroyed with the cell
  {
    {
      Lazy<Poo> x;
      x.emplace(3);
      HARD_ASSERT(x.is_forced() && x.force()->x == 3);
      HARD_ASSERT(Poo::live == 1);

      Lazy<Poo> never([](void *p) { ::new(p) Poo(4); });
      HARD_ASSERT(Poo::live == 1);
    }
    cout << "live poos=" << Poo::live << '\n';
    HARD_ASSERT(Poo::live == 0);
  }

  cout << "ok\n";
  return 0;
}
