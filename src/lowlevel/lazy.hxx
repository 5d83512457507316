#ifndef _4014cb5b_aafc_4ae3_88f7_abd88db9c0d7
#define _4014cb5b_aafc_4ae3_88f7_abd88db9c0d7

# include "diagnostic.hxx"

# include <atomic>
# include <functional>
# include <iostream>
# include <mutex>
# include <new>
# include <thread>
# include <type_traits>
# include <utility>

namespace lazylist {
  enum LazyState {
    lazy_pending,  // producer not run yet
    lazy_busy,     // producer running
    lazy_done,     // value cached
    lazy_poisoned  // producer threw, never to be run again
  };

  /* A memoizing cell. Holds a one-shot producer until first forced, then the
   * value it produced, forever. The producer is handed raw storage and must
   * placement-construct a T there:
   *
   *   Lazy<int> x([](void *p) { ::new(p) int(6*7); });
   *   const int *y = x.force(); // runs the producer
   *   const int *z = x.force(); // y == z, producer not run again
   *
   * force() returns null instead of recursing when the cell's own producer
   * forces it again (on the same thread). An exception escaping the producer
   * propagates out of force() and poisons the cell: forcing it again is a bug.
   *
   * Lazy<T,false> is for one thread at a time. Lazy<T,true> may be forced
   * from many threads: one of them runs the producer while the others wait.
   */
  template<class T, bool concurrent=(KNOB_LAZY_CONCURRENT != 0)>
  class Lazy;

  typedef std::function<void(void*)> LazyCtor;

  template<class T>
  class Lazy<T,false> {
    typename std::aligned_storage<sizeof(T),alignof(T)>::type _val_mem;
    LazyCtor _ctor;
    LazyState _state;

    // turns a still busy cell into a poisoned one on the way out
    struct Canary {
      Lazy<T,false> *me;
      ~Canary() {
        if(me->_state == lazy_busy) {
          me->_state = lazy_poisoned;
          if(KNOB_LAZY_TRACE)
            Say(-1) << "lazy " << (void*)me << " poisoned";
        }
      }
    };

  public:
    Lazy(): _state(lazy_pending) {}
    Lazy(LazyCtor ctor):
      _ctor(std::move(ctor)),
      _state(lazy_pending) {
    }

    Lazy(const Lazy&) = delete;
    Lazy& operator=(const Lazy&) = delete;

    ~Lazy() {
      if(_state == lazy_done)
        reinterpret_cast<T&>(_val_mem).~T();
    }

    // installs the producer of a cell made without one
    void bind(LazyCtor ctor) {
      DEV_ASSERT(_state == lazy_pending && !_ctor);
      _ctor = std::move(ctor);
    }

    // makes the cell done without a producer
    template<class ...Args>
    void emplace(Args &&...args) {
      DEV_ASSERT(_state == lazy_pending && !_ctor);
      ::new(&_val_mem) T(std::forward<Args>(args)...);
      _state = lazy_done;
    }

    const T* force();

    inline LazyState state() const { return _state; }
    inline bool is_forced() const { return _state == lazy_done; }
    inline bool is_poisoned() const { return _state == lazy_poisoned; }

    inline const T* peek() const {
      return _state == lazy_done ? reinterpret_cast<const T*>(&_val_mem) : nullptr;
    }
    inline T* _peek_mut() {
      return _state == lazy_done ? reinterpret_cast<T*>(&_val_mem) : nullptr;
    }
  };

  template<class T>
  const T* Lazy<T,false>::force() {
    switch(_state) {
    case lazy_done:
      return reinterpret_cast<const T*>(&_val_mem);
    case lazy_busy:
      return nullptr;
    case lazy_poisoned:
      DEV_ERROR("Lazy cell forced again after its producer threw.");
      return nullptr;
    case lazy_pending:
      break;
    }

    DEV_ASSERT(_ctor); // forced before bind()
    LazyCtor ctor(std::move(_ctor));
    _ctor = nullptr;

    if(KNOB_LAZY_TRACE)
      Say(+1) << "lazy " << (void*)this << " producing";
    _state = lazy_busy;
    {
      Canary canary{this};
      ctor(&_val_mem);
      _state = lazy_done;
    }
    if(KNOB_LAZY_TRACE)
      Say(-1) << "lazy " << (void*)this << " done";
    return reinterpret_cast<const T*>(&_val_mem);
  }

  template<class T>
  class Lazy<T,true> {
    typename std::aligned_storage<sizeof(T),alignof(T)>::type _val_mem;
    LazyCtor _ctor; // only touched under _once
    std::once_flag _once;
    std::atomic<bool> _done;
    std::atomic<bool> _poisoned;
    // thread running the producer, default id when none
    std::atomic<std::thread::id> _producer;

    struct Canary {
      Lazy<T,true> *me;
      ~Canary() {
        if(!me->_done.load(std::memory_order_relaxed)) {
          me->_poisoned.store(true, std::memory_order_release);
          if(KNOB_LAZY_TRACE)
            Say(-1) << "lazy " << (void*)me << " poisoned";
        }
        me->_producer.store(std::thread::id(), std::memory_order_release);
      }
    };

    void _produce();

  public:
    Lazy():
      _done(false),
      _poisoned(false),
      _producer(std::thread::id()) {
    }
    Lazy(LazyCtor ctor):
      _ctor(std::move(ctor)),
      _done(false),
      _poisoned(false),
      _producer(std::thread::id()) {
    }

    Lazy(const Lazy&) = delete;
    Lazy& operator=(const Lazy&) = delete;

    ~Lazy() {
      if(_done.load(std::memory_order_acquire))
        reinterpret_cast<T&>(_val_mem).~T();
    }

    // must happen before the cell is shared with other threads
    void bind(LazyCtor ctor) {
      DEV_ASSERT(!_done.load() && !_poisoned.load() && !_ctor);
      _ctor = std::move(ctor);
    }

    template<class ...Args>
    void emplace(Args &&...args) {
      DEV_ASSERT(!_ctor);
      std::call_once(_once, [&]() {
        ::new(&_val_mem) T(std::forward<Args>(args)...);
        _done.store(true, std::memory_order_release);
      });
      DEV_ASSERT(_done.load(std::memory_order_acquire));
    }

    const T* force() {
      if(_done.load(std::memory_order_acquire))
        return reinterpret_cast<const T*>(&_val_mem);
      // call_once would deadlock on our own producer
      if(_producer.load(std::memory_order_acquire) == std::this_thread::get_id())
        return nullptr;
      std::call_once(_once, [this]() { this->_produce(); });
      return reinterpret_cast<const T*>(&_val_mem);
    }

    LazyState state() const {
      if(_done.load(std::memory_order_acquire))
        return lazy_done;
      if(_poisoned.load(std::memory_order_acquire))
        return lazy_poisoned;
      if(_producer.load(std::memory_order_acquire) != std::thread::id())
        return lazy_busy;
      return lazy_pending;
    }
    inline bool is_forced() const { return _done.load(std::memory_order_acquire); }
    inline bool is_poisoned() const { return _poisoned.load(std::memory_order_acquire); }

    inline const T* peek() const {
      return _done.load(std::memory_order_acquire) ? reinterpret_cast<const T*>(&_val_mem) : nullptr;
    }
    inline T* _peek_mut() {
      return _done.load(std::memory_order_acquire) ? reinterpret_cast<T*>(&_val_mem) : nullptr;
    }
  };

  // Runs under _once. A throw leaves _once unset so the next forcer lands
  // here again, finds the cell poisoned and reports it.
  template<class T>
  void Lazy<T,true>::_produce() {
    if(_poisoned.load(std::memory_order_acquire))
      DEV_ERROR("Lazy cell forced again after its producer threw.");
    DEV_ASSERT(_ctor); // forced before bind()

    LazyCtor ctor(std::move(_ctor));
    _ctor = nullptr;

    if(KNOB_LAZY_TRACE)
      Say(+1) << "lazy " << (void*)this << " producing on thread " << std::this_thread::get_id();
    _producer.store(std::this_thread::get_id(), std::memory_order_release);
    {
      Canary canary{this};
      ctor(&_val_mem);
      _done.store(true, std::memory_order_release);
    }
    if(KNOB_LAZY_TRACE)
      Say(-1) << "lazy " << (void*)this << " done";
  }

  template<class T, bool concurrent>
  std::ostream& operator<<(std::ostream &o, const Lazy<T,concurrent> &x) {
    switch(x.state()) {
    case lazy_done:
      return o << *x.peek();
    case lazy_busy:
      return o << "<busy>";
    case lazy_poisoned:
      return o << "<poisoned>";
    default:
      return o << "<pending>";
    }
  }
}

#endif
