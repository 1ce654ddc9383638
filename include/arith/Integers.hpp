#ifndef ARITH_INTEGERS_HPP
#define ARITH_INTEGERS_HPP 1

#include <cstdint>
#include <string>

#include "AInt.hpp"
#include "Field.hpp"
#include "Random.hpp"

namespace arith{
	/**
	 * Integer capabilities the rational core is written against.
	 * Only the specialisations below exist.
	 **/
	template<typename I>
	struct IntegerOps;

	template<>
	struct IntegerOps<AInt>{
		static constexpr bool fixedWidth = false;

		static bool isZero(const AInt &x) noexcept{ return x.isZero(); }
		static bool isOne(const AInt &x) noexcept{ return x.isOne(); }
		static bool isEven(const AInt &x) noexcept{ return x.isEven(); }
		static int sign(const AInt &x) noexcept{ return x.sign(); }

		static AInt neg(const AInt &x){ return -x; }
		static AInt add(const AInt &a, const AInt &b){ return a + b; }
		static AInt sub(const AInt &a, const AInt &b){ return a - b; }
		static AInt mul(const AInt &a, const AInt &b){ return a * b; }

		static AInt gcd(const AInt &a, const AInt &b){ return AInt::gcd(a, b); }
		static AInt divexact(const AInt &a, const AInt &b){ return a.divexact(b); }

		static bool isSquare(const AInt &x) noexcept{ return x.isSquare(); }
		static AInt sqrt(const AInt &x, bool check){ return x.sqrt(check); }

		static void setZero(AInt &r) noexcept{ r.setZero(); }
		static void assignMul(AInt &r, const AInt &a, const AInt &b){ r.assignMul(a, b); }
		static void addMul(AInt &r, const AInt &a, const AInt &b){ r.addMul(a, b); }
		static void assignDivexact(AInt &r, const AInt &a, const AInt &b){ r.assignDivexact(a, b); }

		static AInt random(RandState &rng, const AInt &lo, const AInt &hi){ return rng.uniform(lo, hi); }

		static std::string toString(const AInt &x){ return x.toString(); }
	};

	//! Fixed width integers; every operation is checked and throws OverflowError
	template<>
	struct IntegerOps<std::int64_t>{
		static constexpr bool fixedWidth = true;

		static bool isZero(std::int64_t x) noexcept{ return x == 0; }
		static bool isOne(std::int64_t x) noexcept{ return x == 1; }
		static bool isEven(std::int64_t x) noexcept{ return x % 2 == 0; }
		static int sign(std::int64_t x) noexcept{ return (x > 0) - (x < 0); }

		static std::int64_t neg(std::int64_t x);
		static std::int64_t add(std::int64_t a, std::int64_t b);
		static std::int64_t sub(std::int64_t a, std::int64_t b);
		static std::int64_t mul(std::int64_t a, std::int64_t b);

		static std::int64_t gcd(std::int64_t a, std::int64_t b);
		static std::int64_t divexact(std::int64_t a, std::int64_t b);

		static bool isSquare(std::int64_t x) noexcept;
		static std::int64_t sqrt(std::int64_t x, bool check);

		static void setZero(std::int64_t &r) noexcept{ r = 0; }
		static void assignMul(std::int64_t &r, std::int64_t a, std::int64_t b){ r = mul(a, b); }
		static void addMul(std::int64_t &r, std::int64_t a, std::int64_t b){ r = add(r, mul(a, b)); }
		static void assignDivexact(std::int64_t &r, std::int64_t a, std::int64_t b){ r = divexact(a, b); }

		static std::int64_t random(RandState &rng, std::int64_t lo, std::int64_t hi){ return rng.uniform(lo, hi); }

		static std::string toString(std::int64_t x){ return std::to_string(x); }
	};

	//! Descriptor of the integers represented by \p I
	template<typename I>
	class IntegerRing: public Ring{
		public:
			using Elem = I;

			static const IntegerRing &instance() noexcept{
				static const IntegerRing ring;
				return ring;
			}

			std::string toString() const override{ return "Integers"; }
			int characteristic() const noexcept override{ return 0; }
			bool isExactType() const noexcept override{ return true; }

			I zero() const{ return I(0); }
			I one() const{ return I(1); }

		private:
			IntegerRing(){}
	};
}

#endif // !ARITH_INTEGERS_HPP
