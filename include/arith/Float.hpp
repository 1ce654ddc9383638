#ifndef ARITH_FLOAT_HPP
#define ARITH_FLOAT_HPP 1

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "AReal.hpp"
#include "Error.hpp"
#include "Expr.hpp"
#include "Field.hpp"
#include "Random.hpp"
#include "Rational.hpp"

namespace arith{
	template<typename T>
	struct IsFloat: std::is_floating_point<T>{};

	template<>
	struct IsFloat<AReal>: std::true_type{};

	template<typename T>
	using EnableIfFloat = std::enable_if_t<IsFloat<T>::value, int>;

	template<typename T>
	using EnableIfBuiltinFloat = std::enable_if_t<std::is_floating_point<T>::value, int>;

	//! Shortest decimal that reads back as \p x
	template<typename T, EnableIfBuiltinFloat<T> = 0>
	std::string shortestString(T x){
		if(std::isnan(x)) return "NaN";
		if(std::isinf(x)) return x < 0 ? "-Inf" : "Inf";

		std::string str;
		for(int digits = 1; digits <= std::numeric_limits<T>::max_digits10; digits++){
			std::ostringstream os;
			os.precision(digits);
			os << x;
			str = os.str();
			if(static_cast<T>(std::strtold(str.c_str(), nullptr)) == x)
				break;
		}

		if(str.find_first_of(".e") == std::string::npos)
			str += ".0";

		return str;
	}

	//! Float capabilities the float core is written against
	template<typename T>
	struct FloatOps{
		static_assert(std::is_floating_point<T>::value, "FloatOps needs a floating point type");

		static T zero(T = T(0)) noexcept{ return T(0); }
		static T one(T = T(0)) noexcept{ return T(1); }
		static bool isZero(T x) noexcept{ return x == 0; }
		static bool isNegative(T x) noexcept{ return x < 0; }

		static T fromDouble(double d) noexcept{ return static_cast<T>(d); }
		static T fromInteger(std::int64_t i) noexcept{ return static_cast<T>(i); }
		static T fromInteger(const AInt &i) noexcept{ return static_cast<T>(i.toDouble()); }

		static T fromRational(const Rational<std::int64_t> &q) noexcept{
			return static_cast<T>(q.numerator()) / static_cast<T>(q.denominator());
		}

		static T fromRational(const Rational<AInt> &q){
			return static_cast<T>(AInt::ratioToDouble(q.numerator(), q.denominator()));
		}

		static T sqrt(T x) noexcept{ return std::sqrt(x); }
		static T unit(RandState &rng){ return static_cast<T>(rng.unit()); }

		static std::string toString(T x){ return shortestString(x); }
	};

	//! Results take the precision of the operand they are derived from
	template<>
	struct FloatOps<AReal>{
		static AReal zero(const AReal &like){ return AReal(0.0, like.precision()); }
		static AReal one(const AReal &like){ return AReal(1.0, like.precision()); }
		static AReal zero(){ return AReal(0.0); }
		static AReal one(){ return AReal(1.0); }
		static bool isZero(const AReal &x) noexcept{ return x.isZero(); }
		static bool isNegative(const AReal &x) noexcept{ return x.sign() < 0; }

		static AReal fromDouble(double d){ return AReal(d); }
		static AReal fromInteger(std::int64_t i){ return AReal(i); }
		static AReal fromInteger(const AInt &i){ return AReal(i); }

		static AReal fromRational(const Rational<AInt> &q){
			return AReal(q.numerator()) / AReal(q.denominator());
		}

		static AReal sqrt(const AReal &x){ return x.sqrt(); }
		static AReal unit(RandState &rng){ return rng.unitReal(); }

		static std::string toString(const AReal &x){ return x.toString(); }
	};

	//! Floating point numbers of type \p T viewed as a field
	template<typename T>
	class FloatField: public Field{
		public:
			using Elem = T;

			static const FloatField &instance() noexcept{
				static const FloatField field;
				return field;
			}

			std::string toString() const override{ return "Floats"; }
			int characteristic() const noexcept override{ return 0; }
			bool isExactType() const noexcept override{ return false; }

			T zero() const{ return FloatOps<T>::zero(); }
			T one() const{ return FloatOps<T>::one(); }

			T fromFloat(double d) const{ return FloatOps<T>::fromDouble(d); }

			template<typename Int>
			T fromInteger(const Int &i) const{ return FloatOps<T>::fromInteger(i); }

			template<typename Q>
			T fromRational(const Q &q) const{ return FloatOps<T>::fromRational(q); }

			//! lo + u*(hi - lo) for u uniform in [0, 1)
			T random(RandState &rng, double lo, double hi) const{
				if(lo > hi)
					throw DomainError("empty range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");

				auto u = FloatOps<T>::unit(rng);
				auto l = FloatOps<T>::fromDouble(lo);
				return l + u * (FloatOps<T>::fromDouble(hi) - l);
			}

		private:
			FloatField(){}
	};

	template<typename T, EnableIfFloat<T> = 0>
	const FloatField<T> &parentOf(const T&) noexcept{
		return FloatField<T>::instance();
	}

	//! Arbitrary precision reals
	using RR = FloatField<AReal>;

	//! Double precision reals
	using RDF = FloatField<double>;

	//! Zero if both are zero, one otherwise
	template<typename T, EnableIfFloat<T> = 0>
	T gcd(const T &a, const T &b){
		if(FloatOps<T>::isZero(a) && FloatOps<T>::isZero(b))
			return FloatOps<T>::zero(a);

		return FloatOps<T>::one(a);
	}

	/**
	 * \defgroup FloatDivexact Float quotient.
	 * A zero divisor throws DivisionByZero when \p check is set and yields the IEEE result otherwise.
	 * \{
	 **/
	template<typename T, EnableIfFloat<T> = 0>
	T divexact(const T &a, const T &b, bool check = true){
		if(check && FloatOps<T>::isZero(b))
			throw DivisionByZero("division of " + FloatOps<T>::toString(a) + " by zero");

		return a / b;
	}

	template<typename T, EnableIfFloat<T> = 0>
	T divexact(const T &a, std::int64_t b, bool check = true){
		return divexact(a, FloatOps<T>::fromInteger(b), check);
	}

	template<typename T, EnableIfFloat<T> = 0>
	T divexact(std::int64_t a, const T &b, bool check = true){
		return divexact(FloatOps<T>::fromInteger(a), b, check);
	}

	template<typename T, EnableIfBuiltinFloat<T> = 0>
	T divexact(T a, const Rational<std::int64_t> &b, bool check = true){
		return divexact(a, FloatOps<T>::fromRational(b), check);
	}

	template<typename T, EnableIfBuiltinFloat<T> = 0>
	T divexact(const Rational<std::int64_t> &a, T b, bool check = true){
		return divexact(FloatOps<T>::fromRational(a), b, check);
	}

	template<typename T, EnableIfBuiltinFloat<T> = 0>
	T divexact(T a, const AInt &b, bool check = true){
		return divexact(a, FloatOps<T>::fromInteger(b), check);
	}

	template<typename T, EnableIfBuiltinFloat<T> = 0>
	T divexact(const AInt &a, T b, bool check = true){
		return divexact(FloatOps<T>::fromInteger(a), b, check);
	}

	template<typename T, EnableIfBuiltinFloat<T> = 0>
	T divexact(T a, const Rational<AInt> &b, bool check = true){
		return divexact(a, FloatOps<T>::fromRational(b), check);
	}

	template<typename T, EnableIfBuiltinFloat<T> = 0>
	T divexact(const Rational<AInt> &a, T b, bool check = true){
		return divexact(FloatOps<T>::fromRational(a), b, check);
	}

	inline AReal divexact(const AReal &a, const AInt &b, bool check = true){
		return divexact(a, AReal(b, a.precision()), check);
	}

	inline AReal divexact(const AInt &a, const AReal &b, bool check = true){
		return divexact(AReal(a, b.precision()), b, check);
	}

	inline AReal divexact(const AReal &a, const Rational<AInt> &b, bool check = true){
		return divexact(a, FloatOps<AReal>::fromRational(b), check);
	}

	inline AReal divexact(const Rational<AInt> &a, const AReal &b, bool check = true){
		return divexact(FloatOps<AReal>::fromRational(a), b, check);
	}
	/** \} */

	//! (false, 0) if b is zero, otherwise (true, a/b)
	template<typename T, EnableIfFloat<T> = 0>
	std::pair<bool, T> divides(const T &a, const T &b){
		if(FloatOps<T>::isZero(b))
			return {false, FloatOps<T>::zero(b)};

		return {true, divexact(a, b, false)};
	}

	template<typename T, EnableIfFloat<T> = 0>
	std::pair<T, T> divrem(const T &a, const T &b){
		return {a / b, FloatOps<T>::zero(a)};
	}

	template<typename T, EnableIfFloat<T> = 0>
	T div(const T &a, const T &b){
		return a / b;
	}

	//! Delegates to the underlying square root; negative input is not intercepted
	template<typename T, EnableIfFloat<T> = 0>
	T sqrt(const T &a, bool = true){
		return FloatOps<T>::sqrt(a);
	}

	template<typename T, EnableIfFloat<T> = 0>
	bool isUnit(const T &a){ return !FloatOps<T>::isZero(a); }

	template<typename T, EnableIfFloat<T> = 0>
	T canonicalUnit(const T &a){ return a; }

	template<typename T, EnableIfFloat<T> = 0>
	ExprPtr expressify(const T &a){
		if(FloatOps<T>::isNegative(a))
			return std::make_unique<Exprs::UnaryOp>("-", std::make_unique<Exprs::Token>(FloatOps<T>::toString(-a)));

		return std::make_unique<Exprs::Token>(FloatOps<T>::toString(a));
	}

	/**
	 * Fixed precision floats gain nothing from reusing storage: these return the result
	 * by value and ignore the destination. AReal overloads write through MPFR at the
	 * destination's precision and rounding mode.
	 **/
	namespace inplace{
	template<typename T, EnableIfBuiltinFloat<T> = 0>
		T zero(T){ return T(0); }

	template<typename T, EnableIfBuiltinFloat<T> = 0>
		T mul(T, T b, T c){ return b * c; }

	template<typename T, EnableIfBuiltinFloat<T> = 0>
		T add(T, T b, T c){ return b + c; }

	template<typename T, EnableIfBuiltinFloat<T> = 0>
		T addeq(T a, T b){ return a + b; }

	template<typename T, EnableIfBuiltinFloat<T> = 0>
		T addmul(T a, T b, T c, T){ return a + b * c; }

	template<typename T, EnableIfBuiltinFloat<T> = 0>
		T addmul(T a, T b, T c){ return a + b * c; }

		inline AReal &zero(AReal &a){ return a.setZero(); }

		inline AReal &mul(AReal &a, const AReal &b, const AReal &c){ return a.assignMul(b, c); }

		inline AReal &add(AReal &a, const AReal &b, const AReal &c){ return a.assignAdd(b, c); }

		inline AReal &addeq(AReal &a, const AReal &b){ return a.assignAdd(a, b); }

		//! Fused, so the scratch value is not needed
		inline AReal &addmul(AReal &a, const AReal &b, const AReal &c, AReal&){ return a.fma(b, c); }

		inline AReal &addmul(AReal &a, const AReal &b, const AReal &c){ return a.fma(b, c); }
	}
}

#endif // !ARITH_FLOAT_HPP
