#ifndef CHUNKUP_UTIL_SCOPE_GUARD_HPP
#define CHUNKUP_UTIL_SCOPE_GUARD_HPP

#include <utility>

#include "../preprocessor/cat.hpp"

namespace chunkup::util {

/// \brief Runs the given callable when it goes out of scope.
template<class F>
class scope_guard
{
public:
	scope_guard(F && f)
		: f_(std::forward<F>(f))
	{}

	scope_guard(const scope_guard &) = delete;
	scope_guard(scope_guard &&) = delete;
	scope_guard &operator=(const scope_guard &) = delete;
	scope_guard &operator=(scope_guard &&) = delete;

	~scope_guard()
	{
		f_();
	}

private:
	F f_;
};

template<class F>
scope_guard(F && f) -> scope_guard<F>;

#ifdef __COUNTER__
#	define CHUNKUP_SCOPE_GUARD ::chunkup::util::scope_guard CHUNKUP_PP_CAT(CHUNKUP_PP_CAT(chunkup_scope_guard_aux_var_,__COUNTER__),_) = [&]
#endif

}

#endif // CHUNKUP_UTIL_SCOPE_GUARD_HPP
