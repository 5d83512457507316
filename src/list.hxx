#ifndef _3112a820_0998_4818_abd3_9eb88dc62919
#define _3112a820_0998_4818_abd3_9eb88dc62919

# include "diagnostic.hxx"
# include "lowlevel/lazy.hxx"
# include "lowlevel/ref.hxx"

# include <cstddef>
# include <functional>
# include <initializer_list>
# include <iostream>
# include <iterator>
# include <new>
# include <type_traits>
# include <utility>
# include <vector>

namespace lazylist {
  /* Lazy, memoizing, persistent singly-linked list. A LazyList is a handle on
   * the head node of a spine. Each node owns a Lazy cell which, once forced,
   * holds either the end of the list or a head value and the tail node. Forced
   * prefixes are shared by every handle and never recomputed.
   *
   * A list may be built from:
   *   - nothing, by prepending: LazyList<int>().prepend(3).prepend(2)
   *   - a finite source: from(begin,end), from(container), generate(pull)
   *   - its own prefix: cyclic(step). The step function is handed the list
   *     being built and reads the elements produced so far. The element it is
   *     producing reads as unavailable (null).
   */
  template<class T, bool concurrent=(KNOB_LAZY_CONCURRENT != 0)>
  class LazyList {
    struct Node;

    // Contents of a forced node. An ended cons has no head and no tail.
    struct Cons {
      typename std::aligned_storage<sizeof(T),alignof(T)>::type _head_mem;
      Ref<Node> _tail;
      bool _ended;

      Cons(): _ended(true) {}

      template<class U>
      Cons(U &&head, Ref<Node> tail):
        _tail(std::move(tail)),
        _ended(false) {
        ::new(&_head_mem) T(std::forward<U>(head));
      }

      ~Cons() {
        if(!_ended)
          reinterpret_cast<T&>(_head_mem).~T();
      }

      Cons(const Cons&) = delete;
      Cons& operator=(const Cons&) = delete;

      inline bool ended() const { return _ended; }
      inline const T& head() const { return reinterpret_cast<const T&>(_head_mem); }
      inline const Ref<Node>& tail() const { return _tail; }
    };

    struct Node: Referent_<concurrent> {
      Lazy<Cons,concurrent> _cell;

      Node() {}
      Node(LazyCtor ctor):
        _cell(std::move(ctor)) {
      }
      // nil constructor
      Node(Lifetime lifetime):
        Referent_<concurrent>(lifetime) {
        _cell.emplace();
      }

      ~Node();

      // forced contents, or null if forcing reentered a busy cell
      inline const Cons* force() { return _cell.force(); }
    };

  public:
    // Pulls the next element of a source into raw storage. Returns false
    // once the source is exhausted.
    typedef std::function<bool(void *mem)> Pull;
    // Computes the next element of a self-referential list from the list
    // produced so far. Returns false to end the list.
    typedef std::function<bool(const LazyList &so_far, void *mem)> Step;

    class Iter;

  private:
    Ref<Node> _node;

    static Node* _nil() {
      static Node nil(lifetime_static);
      return &nil;
    }

    template<class It>
    static LazyCtor _range_ctor(It it, It end);
    template<class Those>
    static LazyCtor _owned_ctor(RefBoxed<Those,concurrent> those, typename Those::const_iterator it);
    static LazyCtor _pull_ctor(RefBoxed<Pull,concurrent> pull);
    static LazyCtor _cyclic_ctor(RefBoxed<Step,concurrent> step, RefWeak<Node> head);

    // Nodes never leave the class: a tail is only reachable through a handle
    // on its head, which is what keeps a cyclic list's head alive while any
    // of its producers may still run.
    explicit LazyList(Ref<Node> node): _node(std::move(node)) {}

    // constructs a cons into mem by calling `get_head` on the head storage,
    // the tail becomes `next` if a head was produced
    template<class F>
    static void _cons_into(void *mem, Ref<Node> next, const F &get_head) {
      Cons *c = ::new(mem) Cons;
      if(get_head(static_cast<void*>(&c->_head_mem))) {
        c->_ended = false;
        c->_tail = std::move(next);
      }
    }

  public:
    LazyList(): _node(_nil()) {}

    static LazyList nil() { return LazyList(); }

    // elements copied out of [begin,end) one force at a time; the caller
    // keeps the underlying storage alive for as long as the list is unforced
    template<class It>
    static LazyList from(It begin, It end) {
      return LazyList(Ref<Node>(new Node(_range_ctor(begin, end))));
    }

    // takes ownership of a container
    template<class Those>
    static LazyList from(Those those) {
      RefBoxed<Those,concurrent> box = new Boxed<Those,concurrent>(std::move(those));
      typename Those::const_iterator it = box->value().begin();
      return LazyList(Ref<Node>(new Node(_owned_ctor(std::move(box), it))));
    }

    static LazyList make(std::initializer_list<T> xs) {
      return LazyList::from(std::vector<T>(xs));
    }

    static LazyList generate(Pull pull) {
      RefBoxed<Pull,concurrent> box = new Boxed<Pull,concurrent>(std::move(pull));
      return LazyList(Ref<Node>(new Node(_pull_ctor(std::move(box)))));
    }

    static LazyList cyclic(Step step);

    LazyList prepend(T head) const {
      Ref<Node> node = new Node;
      node->_cell.emplace(std::move(head), _node);
      return LazyList(std::move(node));
    }

    friend LazyList cons(T head, const LazyList &tail) {
      return tail.prepend(std::move(head));
    }

    const T* get(std::size_t ix) const;

    const T& operator[](std::size_t ix) const {
      const T *x = this->get(ix);
      USER_ASSERT_F(x != nullptr, "LazyList index " << ix << " out of range.");
      return *x;
    }

    // does not return for an infinite list
    std::size_t size() const;

    // true when the list ends right away
    bool empty() const {
      const Cons *c = _node->force();
      return c != nullptr && c->ended();
    }

    // number of nodes already forced, forces nothing
    std::size_t forced_size() const;

    const T* last() const;

    std::vector<T> take(std::size_t n) const;

    Iter begin() const { return Iter(_node); }
    Iter end() const { return Iter(); }

    template<class F>
    void for_val(const F &f_val) const {
      for(const T &x: *this)
        f_val(x);
    }

    template<class F>
    void for_ix_val(const F &f_ix_val) const {
      std::size_t ix = 0;
      for(const T &x: *this)
        f_ix_val(ix++, x);
    }

    // stops at the first element for which f_val returns false
    template<class F>
    void for_val_while(const F &f_val) const {
      for(const T &x: *this) {
        if(!f_val(x))
          break;
      }
    }

    friend bool operator==(const LazyList &a, const LazyList &b) {
      Node *x = a._node, *y = b._node;
      while(x != y) {
        const Cons *cx = x->force();
        const Cons *cy = y->force();
        if(cx == nullptr || cy == nullptr)
          return cx == cy;
        if(cx->ended() || cy->ended())
          return cx->ended() && cy->ended();
        if(!(cx->head() == cy->head()))
          return false;
        x = cx->tail();
        y = cy->tail();
      }
      return true;
    }
    friend bool operator!=(const LazyList &a, const LazyList &b) {
      return !(a == b);
    }

    // prints the forced prefix only
    friend std::ostream& operator<<(std::ostream &o, const LazyList &xs) {
      o << '[';
      const Cons *c = xs._node->_cell.peek();
      bool first = true;
      while(c != nullptr && !c->ended()) {
        if(!first)
          o << ", ";
        o << c->head();
        first = false;
        c = c->tail()->_cell.peek();
      }
      if(c == nullptr)
        o << (first ? "..." : ", ...");
      return o << ']';
    }
  };

  // Forward iterator over a LazyList. Incrementing forces the next node.
  // Iteration stops at the end of the list, or at a node whose producer is
  // running further up the stack.
  template<class T, bool concurrent>
  class LazyList<T,concurrent>::Iter {
    const Cons *_at; // null at end

    static const Cons* _live(Node *node) {
      const Cons *c = node->force();
      return c != nullptr && !c->ended() ? c : nullptr;
    }

  public:
    typedef std::forward_iterator_tag iterator_category;
    typedef T value_type;
    typedef std::ptrdiff_t difference_type;
    typedef const T* pointer;
    typedef const T& reference;

    Iter(): _at(nullptr) {}
    explicit Iter(Node *node): _at(_live(node)) {}

    inline const T& operator*() const { return _at->head(); }
    inline const T* operator->() const { return &_at->head(); }

    Iter& operator++() {
      _at = _live(_at->tail());
      return *this;
    }
    Iter operator++(int) {
      Iter old = *this;
      ++*this;
      return old;
    }

    inline bool operator==(const Iter &that) const { return _at == that._at; }
    inline bool operator!=(const Iter &that) const { return _at != that._at; }
  };

  template<class T, bool concurrent>
  LazyList<T,concurrent>::Node::~Node() {
    // Unlink the spine iteratively so that dropping a long list does not
    // recurse once per node. Only nodes nobody else holds are unlinked.
    Cons *c = _cell._peek_mut();
    if(c == nullptr)
      return;
    Ref<Node> next = std::move(c->_tail);
    while(next != nullptr && next->_ref_n.load() == 1) {
      Cons *nc = next->_cell._peek_mut();
      if(nc == nullptr)
        break;
      Ref<Node> after = std::move(nc->_tail);
      next = std::move(after); // old next dies with `after`
    }
  }

  template<class T, bool concurrent>
  template<class It>
  LazyCtor LazyList<T,concurrent>::_range_ctor(It it, It end) {
    return [=](void *mem) {
      if(it == end) {
        ::new(mem) Cons;
        return;
      }
      // read before advancing, `it` may be a single pass iterator
      T head(*it);
      It rest = it;
      ++rest;
      Ref<Node> next = new Node(_range_ctor(rest, end));
      ::new(mem) Cons(std::move(head), std::move(next));
    };
  }

  template<class T, bool concurrent>
  template<class Those>
  LazyCtor LazyList<T,concurrent>::_owned_ctor(RefBoxed<Those,concurrent> those, typename Those::const_iterator it) {
    return [=](void *mem) {
      if(it == those->value().end()) {
        ::new(mem) Cons;
        return;
      }
      typename Those::const_iterator rest = it;
      ++rest;
      Ref<Node> next = new Node(_owned_ctor(those, rest));
      ::new(mem) Cons(*it, std::move(next));
    };
  }

  template<class T, bool concurrent>
  LazyCtor LazyList<T,concurrent>::_pull_ctor(RefBoxed<Pull,concurrent> pull) {
    return [=](void *mem) {
      Ref<Node> next = new Node(_pull_ctor(pull));
      _cons_into(mem, std::move(next), [&](void *head_mem) {
        return pull->value()(head_mem);
      });
    };
  }

  template<class T, bool concurrent>
  LazyCtor LazyList<T,concurrent>::_cyclic_ctor(RefBoxed<Step,concurrent> step, RefWeak<Node> head) {
    return [=](void *mem) {
      // whoever forces us reached us from the head, so it cannot be gone
      Ref<Node> self = head.lock();
      HARD_ASSERT(self != nullptr);

      LazyList so_far(std::move(self));
      SAY(KNOB_LAZY_TRACE, "cyclic list " << (void*)so_far._node._obj << " stepping after " << so_far.forced_size() << " elements");

      Ref<Node> next = new Node(_cyclic_ctor(step, head));
      _cons_into(mem, std::move(next), [&](void *head_mem) {
        return step->value()(so_far, head_mem);
      });
    };
  }

  template<class T, bool concurrent>
  LazyList<T,concurrent> LazyList<T,concurrent>::cyclic(Step step) {
    RefBoxed<Step,concurrent> box = new Boxed<Step,concurrent>(std::move(step));
    Ref<Node> head = new Node;
    // the producers only hold the head weakly, else it would own itself
    head->_cell.bind(_cyclic_ctor(std::move(box), RefWeak<Node>(head)));
    return LazyList(std::move(head));
  }

  template<class T, bool concurrent>
  const T* LazyList<T,concurrent>::get(std::size_t ix) const {
    for(const T &x: *this) {
      if(ix-- == 0)
        return &x;
    }
    return nullptr;
  }

  template<class T, bool concurrent>
  std::size_t LazyList<T,concurrent>::size() const {
    std::size_t n = 0;
    for(Iter it = this->begin(); it != this->end(); ++it)
      n += 1;
    return n;
  }

  template<class T, bool concurrent>
  std::size_t LazyList<T,concurrent>::forced_size() const {
    std::size_t n = 0;
    const Cons *c = _node->_cell.peek();
    while(c != nullptr && !c->ended()) {
      n += 1;
      c = c->tail()->_cell.peek();
    }
    return n;
  }

  template<class T, bool concurrent>
  const T* LazyList<T,concurrent>::last() const {
    const T *ans = nullptr;
    for(const T &x: *this)
      ans = &x;
    return ans;
  }

  template<class T, bool concurrent>
  std::vector<T> LazyList<T,concurrent>::take(std::size_t n) const {
    std::vector<T> ans;
    if(n == 0)
      return ans;
    // stop before forcing the node after the n'th
    for(const T &x: *this) {
      ans.push_back(x);
      if(ans.size() == n)
        break;
    }
    return ans;
  }
}
#endif
