#ifndef ARITH_SRC_IMPLS_HPP
#define ARITH_SRC_IMPLS_HPP 1

#include <gmp.h>
#include <mpfr.h>

#include "arith/AInt.hpp"
#include "arith/AReal.hpp"
#include "arith/Random.hpp"

struct arith::AInt::Impl{
	~Impl(){ mpz_clear(value); }

	mpz_t value;
};

struct arith::AReal::Impl{
	~Impl(){ mpfr_clear(value); }

	mpfr_t value;
	Rounding rounding;
};

struct arith::RandState::Impl{
	~Impl(){ gmp_randclear(state); }

	gmp_randstate_t state;
};

namespace arith{
	inline mpfr_rnd_t toMpfrRounding(AReal::Rounding r) noexcept{
		switch(r){
			case AReal::Rounding::towardZero: return MPFR_RNDZ;
			case AReal::Rounding::up: return MPFR_RNDU;
			case AReal::Rounding::down: return MPFR_RNDD;
			case AReal::Rounding::awayFromZero: return MPFR_RNDA;
			default: return MPFR_RNDN;
		}
	}
}

#endif // !ARITH_SRC_IMPLS_HPP
