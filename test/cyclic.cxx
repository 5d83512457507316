#include "list.hxx"

#include <iostream>
#include <vector>

using namespace lazylist;
using namespace std;

struct Poo {
  static int live;
  long x;
  Poo(long x): x(x) { live++; }
  Poo(const Poo &that): x(that.x) { live++; }
  ~Poo() { live--; }
};
int Poo::live = 0;

namespace {
  int steps = 0;

  // 2, 3, then the next odd number no earlier element divides. Ends after
  // `cutoff` primes.
  LazyList<long>::Step sieve(size_t cutoff) {
    return [=](const LazyList<long> &primes, void *mem) -> bool {
      steps++;
      size_t n = primes.size();
      if(n == cutoff)
        return false;

      long p;
      if(n == 0)
        p = 2;
      else if(n == 1)
        p = 3;
      else {
        p = *primes.last() + 2;
        bool prime;
        do {
          prime = true;
          for(long q: primes) {
            if(p % q == 0) {
              prime = false;
              p += 2;
              break;
            }
          }
        } while(!prime);
      }
      ::new(mem) long(p);
      return true;
    };
  }
}

int main() {
  // the 100th prime
  {
    steps = 0;
    LazyList<long> primes = LazyList<long>::cyclic(sieve(100));
    HARD_ASSERT(steps == 0);
    HARD_ASSERT(primes.take(10) == vector<long>({2, 3, 5, 7, 11, 13, 17, 19, 23, 29}));
    HARD_ASSERT(steps == 10);

    cout << "primes[99]=" << primes[99] << '\n';
    HARD_ASSERT(primes[99] == 541);
    HARD_ASSERT(*primes.last() == 541);
    HARD_ASSERT(primes.size() == 100);
    HARD_ASSERT(primes.get(100) == nullptr);
    // one step per element plus the one that ended the list
    HARD_ASSERT(steps == 101);

    // a copy of the handle sees the same cached elements
    LazyList<long> again = primes;
    HARD_ASSERT(again.get(50) == primes.get(50));
    HARD_ASSERT(again.size() == 100);
    HARD_ASSERT(steps == 101);

    // prepending to a cyclic list keeps it working
    LazyList<long> withone = primes.prepend(1);
    HARD_ASSERT(withone.size() == 101 && withone[100] == 541);
  }

  // the element under production reads as unavailable
  {
    vector<bool> reentered;
    vector<bool> looked_empty;
    LazyList<int> xs = LazyList<int>::cyclic(
      [&](const LazyList<int> &so_far, void *mem) -> bool {
        size_t n = so_far.size();
        reentered.push_back(so_far.get(n) != nullptr);
        looked_empty.push_back(so_far.empty());
        if(n == 5)
          return false;
        ::new(mem) int(n == 0 ? 1 : 2 * *so_far.last());
        return true;
      }
    );
    xs.size();
    cout << "powers: " << xs << '\n';
    HARD_ASSERT(xs.take(10) == vector<int>({1, 2, 4, 8, 16}));
    HARD_ASSERT(reentered.size() == 6);
    for(bool r: reentered)
      HARD_ASSERT(!r);
    // the head is busy, not ended, while the first element is produced
    for(bool e: looked_empty)
      HARD_ASSERT(!e);
  }

  // ending right away
  {
    LazyList<int> none = LazyList<int>::cyclic(
      [](const LazyList<int> &so_far, void *mem) -> bool { return false; }
    );
    HARD_ASSERT(none.empty() && none.size() == 0);
  }

  // endless: the caller decides where to stop
  {
    LazyList<long> fib = LazyList<long>::cyclic(
      [](const LazyList<long> &so_far, void *mem) -> bool {
        size_t n = so_far.size();
        ::new(mem) long(n < 2 ? long(n) : *so_far.get(n-1) + *so_far.get(n-2));
        return true;
      }
    );
    long last = 0;
    fib.for_val_while([&](long x) {
      last = x;
      return x < 1000;
    });
    cout << "first fib over 1000: " << last << '\n';
    HARD_ASSERT(last == 1597);
    HARD_ASSERT(fib.forced_size() == 18);
  }

  // any surviving handle keeps the elements a later step reads
  {
    LazyList<int>::Step naturals = [](const LazyList<int> &so_far, void *mem) -> bool {
      ::new(mem) int(int(so_far.size()));
      return true;
    };

    LazyList<int> nat = LazyList<int>::cyclic(naturals);
    HARD_ASSERT(nat[2] == 2);
    LazyList<int> ys = nat.prepend(-1);
    nat = LazyList<int>();
    HARD_ASSERT(ys[6] == 5);
    HARD_ASSERT(ys.forced_size() == 7);

    // a handle the step itself kept
    LazyList<int> kept;
    {
      LazyList<int> evens = LazyList<int>::cyclic(
        [&](const LazyList<int> &so_far, void *mem) -> bool {
          if(so_far.forced_size() == 0)
            kept = so_far;
          ::new(mem) int(2 * int(so_far.size()));
          return true;
        }
      );
      HARD_ASSERT(evens[1] == 2);
    }
    HARD_ASSERT(kept[5] == 10);
    kept = LazyList<int>();
  }

  // a partially forced self-referential list does not keep itself alive
  {
    {
      LazyList<Poo> xs = LazyList<Poo>::cyclic(
        [](const LazyList<Poo> &so_far, void *mem) -> bool {
          ::new(mem) Poo(long(so_far.size()));
          return true;
        }
      );
      HARD_ASSERT(xs[9].x == 9);
      HARD_ASSERT(Poo::live == 10);
    }
    cout << "live poos=" << Poo::live << '\n';
    HARD_ASSERT(Poo::live == 0);
  }

  cout << "ok\n";
  return 0;
}
