#ifndef ARITH_RATIONALFIELD_HPP
#define ARITH_RATIONALFIELD_HPP 1

#include <cstdint>
#include <string>
#include <vector>

#include "Field.hpp"
#include "Integers.hpp"
#include "Random.hpp"
#include "Rational.hpp"

namespace arith{
	//! Field of fractions over the integers \p I
	template<typename I>
	class RationalField: public Field{
		public:
			using Elem = Rational<I>;

			static const RationalField &instance() noexcept{
				static const RationalField field;
				return field;
			}

			std::string toString() const override{ return "Rationals"; }
			int characteristic() const noexcept override{ return 0; }
			bool isExactType() const noexcept override{ return true; }

			const IntegerRing<I> *baseRing() const noexcept override{ return &IntegerRing<I>::instance(); }

			Elem zero() const{ return Elem(); }
			Elem one() const{ return Elem(I(1)); }

			Elem fromInteger(const I &n) const{ return Elem(n); }

			//! n/d in lowest terms, throws DivisionByZero if d is zero
			Elem fromPair(const I &n, const I &d) const{ return Elem(n, d); }

			/**
			 * Random rational with numerator and nonzero denominator drawn from [lo, hi].
			 * The denominator is redrawn until it is nonzero.
			 **/
			Elem random(RandState &rng, const I &lo, const I &hi) const{
				using Ops = IntegerOps<I>;
				if(Ops::isZero(lo) && Ops::isZero(hi))
					throw DomainError("no nonzero denominator in [0, 0]");

				auto d = I(0);
				while(Ops::isZero(d))
					d = Ops::random(rng, lo, hi);

				auto n = Ops::random(rng, lo, hi);
				return Elem(n, d);
			}

			//! Random rational with numerator and nonzero denominator picked from \p choices
			Elem random(RandState &rng, const std::vector<I> &choices) const{
				using Ops = IntegerOps<I>;

				bool hasNonzero = false;
				for(auto &&c : choices)
					hasNonzero = hasNonzero || !Ops::isZero(c);

				if(!hasNonzero)
					throw DomainError("no nonzero denominator among the choices");

				auto pick = [&]() -> const I&{
					auto idx = rng.uniform(std::int64_t(0), static_cast<std::int64_t>(choices.size()) - 1);
					return choices[static_cast<std::size_t>(idx)];
				};

				auto d = I(0);
				while(Ops::isZero(d))
					d = pick();

				return Elem(pick(), d);
			}

		private:
			RationalField(){}
	};

	//! Field of fractions of \p ZZ; its baseRing() is \p ZZ again
	template<typename I>
	const RationalField<I> &fractionField(const IntegerRing<I>&) noexcept{
		return RationalField<I>::instance();
	}

	template<typename I>
	const RationalField<I> &parentOf(const Rational<I>&) noexcept{
		return RationalField<I>::instance();
	}

	//! Rationals over arbitrary precision integers
	using QQ = RationalField<AInt>;

	//! Rationals over 64 bit integers
	using SmallQQ = RationalField<std::int64_t>;
}

#endif // !ARITH_RATIONALFIELD_HPP
