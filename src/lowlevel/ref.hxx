#ifndef _adca429b_ad48_4165_a06b_5987963b2c35
#define _adca429b_ad48_4165_a06b_5987963b2c35

# include <atomic>
# include <cstddef>
# include <utility>

namespace lazylist {
  enum Lifetime {
    lifetime_static,
    lifetime_dynamic
  };

  // A reference counter, plain for one thread or atomic for many.
  template<bool concurrent>
  struct RefCount;

  template<>
  struct RefCount<false> {
    unsigned _n;

    RefCount(unsigned n): _n(n) {}

    inline unsigned load() const { return _n; }
    inline void inc() { _n += 1; }
    // returns the decremented count
    inline unsigned dec() { return _n -= 1; }
    // increments unless the count already reached zero
    inline bool inc_nonzero() {
      if(_n == 0)
        return false;
      _n += 1;
      return true;
    }
  };

  template<>
  struct RefCount<true> {
    std::atomic<unsigned> _n;

    RefCount(unsigned n): _n(n) {}

    inline unsigned load() const { return _n.load(std::memory_order_acquire); }
    inline void inc() { _n.fetch_add(1, std::memory_order_relaxed); }
    inline unsigned dec() { return _n.fetch_sub(1, std::memory_order_acq_rel) - 1; }
    inline bool inc_nonzero() {
      unsigned n = _n.load(std::memory_order_relaxed);
      do {
        if(n == 0)
          return false;
      } while(!_n.compare_exchange_weak(n, n+1, std::memory_order_acq_rel, std::memory_order_relaxed));
      return true;
    }
  };

  // Reference countable object must inherit from this. When the last strong
  // reference goes the object is destroyed, but its memory stays until the
  // last weak reference goes too. The strong references collectively hold one
  // weak count so that a weak reference can never free a live object.
  template<bool concurrent=false>
  struct Referent_ {
    RefCount<concurrent> _ref_n;
    RefCount<concurrent> _weak_n;

    Referent_(Lifetime lifetime=lifetime_dynamic):
      _ref_n(lifetime == lifetime_static ? ~0u>>1 : 0),
      _weak_n(1) {
    }

    virtual ~Referent_() = default;

    inline void _incref() { _ref_n.inc(); }
    inline bool _incref_nonzero() { return _ref_n.inc_nonzero(); }
    inline void _incweak() { _weak_n.inc(); }
    void _decref();
    void _decweak();

    Referent_(const Referent_&) = delete;
    Referent_& operator=(const Referent_&) = delete;
    Referent_(Referent_&&) = delete;
    Referent_& operator=(Referent_&&) = delete;
  };

  typedef Referent_<false> Referent;

  template<bool concurrent>
  inline void Referent_<concurrent>::_decref() {
    if(0 == _ref_n.dec()) {
      this->~Referent_();
      _decweak();
    }
  }

  template<bool concurrent>
  inline void Referent_<concurrent>::_decweak() {
    if(0 == _weak_n.dec())
      ::operator delete(this);
  }

  // The reference counted pointer class. Equality is address equality.
  template<class T>
  struct Ref {
    mutable T *_obj;

    inline Ref(T *obj=nullptr) noexcept:
      _obj(obj) {
      if(_obj)
        _obj->_incref();
    }

    inline Ref(const Ref<T> &that) noexcept {
      _obj = that._obj;
      if(_obj) _obj->_incref();
    }

    inline Ref<T>& operator=(const Ref<T> &that) noexcept {
      T *that_obj = that._obj;
      if(that_obj)
        that_obj->_incref();
      if(this->_obj)
        this->_obj->_decref();
      this->_obj = that_obj;
      return *this;
    }

    inline Ref(Ref<T> &&that) noexcept {
      _obj = that._obj;
      that._obj = nullptr;
    }

    // swaps, the old object is released when `that` goes
    inline Ref<T>& operator=(Ref<T> &&that) noexcept {
      T *tmp = this->_obj;
      this->_obj = that._obj;
      that._obj = tmp;
      return *this;
    }

    inline ~Ref() noexcept {
      if(_obj) _obj->_decref();
    }

    inline operator T*() const { return _obj; }

    inline T& operator*() const { return *_obj; }
    inline T* operator->() const { return _obj; }
  };

  // Weak reference version of Ref. Does not keep the object alive, only its
  // memory. lock() hands out a strong reference if the object is still alive,
  // otherwise null. A dead reference and a null reference are not the same:
  // is_dead() tells if this used to point to an object that is gone.
  template<class T>
  struct RefWeak {
    T *_obj;

    RefWeak(T *obj=nullptr) noexcept {
      _obj = obj;
      if(_obj) _obj->_incweak();
    }

    RefWeak(const Ref<T> &that) noexcept:
      _obj(that._obj) {
      if(_obj)
        _obj->_incweak();
    }

    RefWeak(const RefWeak<T> &that) noexcept:
      _obj(that._obj) {
      if(_obj)
        _obj->_incweak();
    }

    RefWeak<T>& operator=(const RefWeak<T> &that) noexcept {
      T *that_obj = that._obj;
      if(that_obj)
        that_obj->_incweak();
      if(this->_obj)
        this->_obj->_decweak();
      this->_obj = that_obj;
      return *this;
    }

    inline RefWeak(RefWeak<T> &&that) noexcept {
      _obj = that._obj;
      that._obj = nullptr;
    }

    inline RefWeak<T>& operator=(RefWeak<T> &&that) noexcept {
      T *tmp = this->_obj;
      this->_obj = that._obj;
      that._obj = tmp;
      return *this;
    }

    inline ~RefWeak() noexcept {
      if(this->_obj)
        this->_obj->_decweak();
    }

    inline bool is_dead() const {
      return _obj != nullptr && _obj->_ref_n.load() == 0;
    }

    Ref<T> lock() const {
      Ref<T> ans;
      if(_obj && _obj->_incref_nonzero())
        ans._obj = _obj; // count already taken
      return ans;
    }
  };


  //////////////////////////////////////////////////////////////////////
  // Referent boxes allow values of T to be reference counted when T
  // does not inherit from Referent

  template<class T, bool concurrent=false>
  struct Boxed: Referent_<concurrent> {
    T _value;

    template<class ...Args>
    Boxed(Args &&...args):
      _value(std::forward<Args>(args)...) {
    }

    inline T& value() { return _value; }
    inline const T& value() const { return _value; }
  };

  template<class T, bool concurrent=false>
  using RefBoxed = Ref<Boxed<T,concurrent>>;
}

#endif
