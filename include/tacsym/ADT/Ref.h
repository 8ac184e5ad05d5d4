//===-- Ref.h ---------------------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

/**
 * @file Ref.h
 * @brief Implements smart-pointer ref<> used by TACSym.
 *
 * ## Basic usage:
 *
 * Add the following to your struct/class to enable ref<> pointer usage
 * @code{.cpp}
 *
 * struct MyStruct{
 *   ...
 *   /// @brief Required by tacsym::ref-managed objects
 *   class tacsym::ReferenceCounter _refCount;
 *   ...
 * }
 * @endcode
 *
 */

#ifndef TACSYM_REF_H
#define TACSYM_REF_H

#include "llvm/Support/Casting.h"
#include "llvm/Support/raw_ostream.h"

#include <cassert>
#include <utility>

namespace llvm {
  class raw_ostream;
} // namespace llvm

namespace tacsym {

template<class T>
class ref;

/// Reference counter to be used as part of a ref-managed struct or class
class ReferenceCounter {
  template<class T>
  friend class ref;

  /// Count how often the object has been referenced.
  unsigned refCount = 0;

public:
  ReferenceCounter() = default;
  ~ReferenceCounter() = default;

  // Explicitly initialise reference counter with 0 again
  // As this object is part of another object, the copy-constructor
  // might be invoked as part of the other one.
  ReferenceCounter(const ReferenceCounter& ) {}

  /// Returns the number of parallel references of this object
  /// \return number of references on this object
  unsigned getCount() { return refCount; }

  // Copy assignment operator
  ReferenceCounter &operator=(const ReferenceCounter &a) {
    if (this == &a)
      return *this;
    // The new copy won't be referenced
    refCount = 0;
    return *this;
  }

  // Do not allow move operations for the reference counter
  // as otherwise, references become incorrect.
  ReferenceCounter(ReferenceCounter &&r) noexcept = delete;
  ReferenceCounter &operator=(ReferenceCounter &&other) noexcept = delete;
};

template<class T>
class ref {
  T *ptr;

public:
  // default constructor: create a NULL reference
  ref() : ptr(nullptr) {}
  ~ref () { dec (); }

private:
  void inc() const {
    if (ptr)
      ++ptr->_refCount.refCount;
  }

  void dec() const {
    if (ptr && --ptr->_refCount.refCount == 0)
      delete ptr;
  }

public:
  template<class U> friend class ref;

  // constructor from pointer
  ref(T *p) : ptr(p) {
    inc();
  }

  // normal copy constructor
  ref(const ref<T> &r) : ptr(r.ptr) {
    inc();
  }

  // conversion constructor
  template<class U>
  ref (const ref<U> &r) : ptr(r.ptr) {
    inc();
  }

  // normal move constructor: invoke the move assignment operator
  ref(ref<T> &&r) noexcept : ptr(nullptr) { *this = std::move(r); }

  // conversion move constructors: invoke the move assignment operator
  template <class U> ref(ref<U> &&r) noexcept : ptr(nullptr) {
    *this = std::move(r);
  }

  // pointer operations
  T *get () const {
    return ptr;
  }

  /* The copy assignment operator must also explicitly be defined,
   * despite a redundant template. */
  ref<T> &operator= (const ref<T> &r) {
    r.inc();
    // The referenced object may be released by dec(), e.g. for
    // `root = root->kid`, so keep the incoming pointer first.
    T *saved_ptr = r.ptr;
    dec();
    ptr = saved_ptr;

    return *this;
  }

  template<class U> ref<T> &operator= (const ref<U> &r) {
    r.inc();
    U *saved_ptr = r.ptr;
    dec();
    ptr = saved_ptr;

    return *this;
  }

  // Move assignment operator
  ref<T> &operator=(ref<T> &&r) noexcept {
    if (this == &r)
      return *this;
    dec();
    ptr = r.ptr;
    r.ptr = nullptr;
    return *this;
  }

  // Move assignment operator
  template <class U> ref<T> &operator=(ref<U> &&r) noexcept {
    if (static_cast<void *>(this) == static_cast<void *>(&r))
      return *this;

    dec();
    ptr = r.ptr;
    r.ptr = nullptr;
    return *this;
  }

  T& operator*() const {
    return *ptr;
  }

  T* operator->() const {
    return ptr;
  }

  bool isNull() const { return ptr == nullptr; }
  explicit operator bool() const noexcept { return !isNull(); }

  // assumes non-null arguments
  int compare(const ref &rhs) const {
    assert(!isNull() && !rhs.isNull() && "Invalid call to compare()");
    return get()->compare(*rhs.get());
  }

  // assumes non-null arguments
  bool operator<(const ref &rhs) const { return compare(rhs)<0; }
  bool operator==(const ref &rhs) const { return compare(rhs)==0; }
  bool operator!=(const ref &rhs) const { return compare(rhs)!=0; }
};

template<class T>
inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const ref<T> &e) {
  os << *e;
  return os;
}

} // end namespace tacsym

namespace llvm {
// Lets isa<>, cast<> and dyn_cast<> look through a ref<> to the raw pointer.
template<typename T>
struct simplify_type<const ::tacsym::ref<T> > {
  using SimpleType = T *;
  static SimpleType getSimplifiedValue(const ::tacsym::ref<T> &ref) {
    return ref.get();
  }
};

template<typename T>
struct simplify_type< ::tacsym::ref<T> >
  : public simplify_type<const ::tacsym::ref<T> > {};
}  // namespace llvm

#endif /* TACSYM_REF_H */
