#if !defined(REFCOUNT_H)
#define REFCOUNT_H
/*
 * Reference counting with delete on last release.
 * Compiled programs, subjects and errors are shared this way.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<atomic>

class	RefCounted
{
public:
	virtual		~RefCounted() { }
			RefCounted() : ref_count(0) {}
			RefCounted(const RefCounted&) : ref_count(0) {}	// A copy starts unshared
	void		AddRef() const { (void)ref_count++; }
	void		Release() const { if (--ref_count == 0) delete this; }
			// Only for debugging, may be instantly stale unless == 1:
	int		GetRefCount() const { return (int)ref_count; }

private:
	mutable std::atomic<int>	ref_count;
};

/*
 * A counted reference. T may be const-qualified, in which case only
 * the const interface of the referenced object is available.
 */
template <class T>
class Ref
{
	std::atomic<T*>	ptr;

public:
			~Ref() { T* o = ptr; if (o) o->Release(); }
			Ref() : ptr(0) {}
			Ref(T* o) : ptr(o) { if (o) o->AddRef(); }
			Ref(const Ref& other) : ptr(0) { T* o = other; if (o) o->AddRef(); ptr = o; }
	Ref&		operator=(const Ref& other)
			{
				T*      o = other;
				if (o)
					o->AddRef();
				o = (T*)ptr.exchange(o);
				if (o)
					o->Release();
				return *this;
			}
	Ref&		operator=(T* other)
			{
				if (other)
					other->AddRef();

				T*      o = (T*)ptr.exchange(other);
				if (o)
					o->Release();
				return *this;
			}

			operator T*() const { return ptr; }
	T*		operator->() const { return ptr; }
	T&		operator*() const { return *(T*)ptr; }
			explicit operator bool() const { return ptr != 0; }

	int		GetRefCount() const
			{	// If the value is > 1 another thread might change it before we use it
				T*      o = (T*)ptr;
				return o ? o->GetRefCount() : 0;
			}
};

#endif	// REFCOUNT_H
