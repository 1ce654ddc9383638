#ifndef ARITH_RATIONAL_HPP
#define ARITH_RATIONAL_HPP 1

#include <ostream>
#include <string>
#include <tuple>
#include <utility>

#include "Error.hpp"
#include "Expr.hpp"
#include "Integers.hpp"

namespace arith{
	/**
	 * Fraction of two integers of type \p I.
	 *
	 * The denominator is always positive and shares no factor with the numerator;
	 * zero is stored as 0/1. Every operation producing a Rational reduces its result
	 * on the spot from the terms it has just computed, instead of going through the
	 * normalizing constructor.
	 **/
	template<typename I>
	class Rational{
		public:
			using Int = I;
			using Ops = IntegerOps<I>;

			Rational(): m_num(0), m_den(1){}

			explicit Rational(const I &n): m_num(n), m_den(1){}

			//! n/d in lowest terms, throws DivisionByZero if d is zero
			Rational(const I &n, const I &d): m_num(n), m_den(d){
				if(Ops::isZero(m_den))
					throw DivisionByZero("zero denominator in " + Ops::toString(n) + "//" + Ops::toString(d));

				if(!Ops::isOne(m_den) && !Ops::isZero(m_num)){
					auto g = Ops::gcd(m_num, m_den);
					Ops::assignDivexact(m_num, m_num, g);
					Ops::assignDivexact(m_den, m_den, g);
				}

				if(Ops::sign(m_den) < 0){
					m_num = Ops::neg(m_num);
					m_den = Ops::neg(m_den);
				}

				if(Ops::isZero(m_num))
					m_den = I(1);
			}

			const I &numerator() const noexcept{ return m_num; }
			const I &denominator() const noexcept{ return m_den; }

			bool isZero() const noexcept{ return Ops::isZero(m_num); }
			bool isOne() const noexcept{ return Ops::isOne(m_num) && Ops::isOne(m_den); }

			Rational operator*(const Rational &rhs) const{
				auto n = Ops::mul(m_num, rhs.m_num);
				auto d = Ops::mul(m_den, rhs.m_den);
				if(!Ops::isOne(d) && !Ops::isZero(n)){
					auto g = Ops::gcd(n, d);
					Ops::assignDivexact(n, n, g);
					Ops::assignDivexact(d, d, g);
				}

				if(Ops::isZero(n))
					return Rational(Reduced{}, std::move(n), I(1));

				return Rational(Reduced{}, std::move(n), std::move(d));
			}

			Rational operator+(const Rational &rhs) const{
				auto n = Ops::mul(m_num, rhs.m_den);
				Ops::addMul(n, rhs.m_num, m_den);
				auto d = Ops::mul(m_den, rhs.m_den);
				if(!Ops::isOne(d) && !Ops::isZero(n)){
					auto g = Ops::gcd(n, d);
					Ops::assignDivexact(n, n, g);
					Ops::assignDivexact(d, d, g);
				}

				if(Ops::isZero(n))
					return Rational(Reduced{}, std::move(n), I(1));

				return Rational(Reduced{}, std::move(n), std::move(d));
			}

			Rational operator-(const Rational &rhs) const{
				auto n = Ops::sub(Ops::mul(m_num, rhs.m_den), Ops::mul(rhs.m_num, m_den));
				auto d = Ops::mul(m_den, rhs.m_den);
				if(!Ops::isOne(d) && !Ops::isZero(n)){
					auto g = Ops::gcd(n, d);
					Ops::assignDivexact(n, n, g);
					Ops::assignDivexact(d, d, g);
				}

				if(Ops::isZero(n))
					return Rational(Reduced{}, std::move(n), I(1));

				return Rational(Reduced{}, std::move(n), std::move(d));
			}

			//! Throws DivisionByZero if rhs is zero
			Rational operator/(const Rational &rhs) const{
				if(rhs.isZero())
					throw DivisionByZero("division of " + toString() + " by zero");

				auto n = Ops::mul(m_num, rhs.m_den);
				auto d = Ops::mul(m_den, rhs.m_num);
				if(!Ops::isOne(d) && !Ops::isZero(n)){
					auto g = Ops::gcd(n, d);
					Ops::assignDivexact(n, n, g);
					Ops::assignDivexact(d, d, g);
				}

				if(Ops::sign(d) < 0){
					n = Ops::neg(n);
					d = Ops::neg(d);
				}

				if(Ops::isZero(n))
					return Rational(Reduced{}, std::move(n), I(1));

				return Rational(Reduced{}, std::move(n), std::move(d));
			}

			Rational operator-() const{
				return Rational(Reduced{}, Ops::neg(m_num), m_den);
			}

			bool operator==(const Rational &rhs) const noexcept{
				return m_num == rhs.m_num && m_den == rhs.m_den;
			}

			bool operator!=(const Rational &rhs) const noexcept{ return !(*this == rhs); }

			bool operator<(const Rational &rhs) const{
				return Ops::mul(m_num, rhs.m_den) < Ops::mul(rhs.m_num, m_den);
			}

			bool operator>(const Rational &rhs) const{ return rhs < *this; }
			bool operator<=(const Rational &rhs) const{ return !(rhs < *this); }
			bool operator>=(const Rational &rhs) const{ return !(*this < rhs); }

			/**
			 * gcd(p, q) = gcd(p.num*q.den, p.den*q.num) / (p.den*q.den).
			 * Zero if both are zero, otherwise a unit.
			 **/
			static Rational gcd(const Rational &p, const Rational &q){
				auto a = Ops::mul(p.m_num, q.m_den);
				auto b = Ops::mul(p.m_den, q.m_num);
				auto n = Ops::gcd(a, b);
				auto d = Ops::mul(p.m_den, q.m_den);
				if(!Ops::isOne(d) && !Ops::isZero(n)){
					auto g = Ops::gcd(n, d);
					Ops::assignDivexact(n, n, g);
					Ops::assignDivexact(d, d, g);
				}

				if(Ops::isZero(n))
					return Rational(Reduced{}, std::move(n), I(1));

				return Rational(Reduced{}, std::move(n), std::move(d));
			}

			/**
			 * \defgroup RationalInplace Destination-mutating arithmetic.
			 *
			 * Results are written into the storage of *this. Arbitrary precision
			 * numerators and denominators are overwritten limb-wise; fixed width ones
			 * are computed first and assigned together, so an overflow leaves *this
			 * untouched.
			 * \{
			 **/
			Rational &setZero(){
				Ops::setZero(m_num);
				if(!Ops::isOne(m_den))
					m_den = I(1);

				return *this;
			}

			//! *this = b*c
			Rational &assignMul(const Rational &b, const Rational &c){
				requireCanonical(b, "mul");
				requireCanonical(c, "mul");

				if constexpr(Ops::fixedWidth){
					*this = b * c;
					return *this;
				}
				else{
					Ops::assignMul(m_num, b.m_num, c.m_num);
					Ops::assignMul(m_den, b.m_den, c.m_den);
					if(!Ops::isOne(m_den) && !Ops::isZero(m_num)){
						auto g = Ops::gcd(m_num, m_den);
						Ops::assignDivexact(m_num, m_num, g);
						Ops::assignDivexact(m_den, m_den, g);
					}

					if(Ops::isZero(m_num) && !Ops::isOne(m_den))
						m_den = I(1);

					return *this;
				}
			}

			//! *this = b + c; aliasing of *this with either operand is resolved first
			Rational &assignAdd(const Rational &b, const Rational &c){
				if(this == &b)
					return addEq(c);
				else if(*this == c)
					return addEq(b);

				requireCanonical(b, "add");
				requireCanonical(c, "add");

				if constexpr(Ops::fixedWidth){
					*this = b + c;
					return *this;
				}
				else{
					Ops::assignMul(m_den, b.m_den, c.m_den);
					Ops::assignMul(m_num, b.m_num, c.m_den);
					Ops::addMul(m_num, b.m_den, c.m_num);
					if(!Ops::isOne(m_den) && !Ops::isZero(m_num)){
						auto g = Ops::gcd(m_num, m_den);
						Ops::assignDivexact(m_num, m_num, g);
						Ops::assignDivexact(m_den, m_den, g);
					}

					if(Ops::isZero(m_num) && !Ops::isOne(m_den))
						m_den = I(1);

					return *this;
				}
			}

			//! *this += b
			Rational &addEq(const Rational &b){
				requireCanonical(*this, "addeq");

				if(this == &b){
					// n/d reduced: d even means n odd, so n/(d/2) is reduced too
					if(Ops::isEven(m_den))
						Ops::assignDivexact(m_den, m_den, I(2));
					else
						Ops::assignMul(m_num, m_num, I(2));

					return *this;
				}

				requireCanonical(b, "addeq");

				if constexpr(Ops::fixedWidth){
					*this = *this + b;
					return *this;
				}
				else{
					Ops::assignMul(m_num, m_num, b.m_den);
					Ops::addMul(m_num, b.m_num, m_den);
					Ops::assignMul(m_den, m_den, b.m_den);
					if(!Ops::isOne(m_den) && !Ops::isZero(m_num)){
						auto g = Ops::gcd(m_num, m_den);
						Ops::assignDivexact(m_num, m_num, g);
						Ops::assignDivexact(m_den, m_den, g);
					}

					if(Ops::isZero(m_num) && !Ops::isOne(m_den))
						m_den = I(1);

					return *this;
				}
			}

			//! *this += b*c, with the product held in \p tmp
			Rational &addMul(const Rational &b, const Rational &c, Rational &tmp){
				if(&tmp == this)
					return addMul(b, c);

				tmp.assignMul(b, c);
				return addEq(tmp);
			}

			//! *this += b*c
			Rational &addMul(const Rational &b, const Rational &c){
				Rational tmp;
				tmp.assignMul(b, c);
				return addEq(tmp);
			}
			/** \} */

			std::string toString() const{
				if(Ops::isOne(m_den))
					return Ops::toString(m_num);

				return Ops::toString(m_num) + "//" + Ops::toString(m_den);
			}

		private:
			struct Reduced{};

			Rational(Reduced, I n, I d): m_num(std::move(n)), m_den(std::move(d)){}

			static void requireCanonical(const Rational &x, const char *op){
				if(Ops::sign(x.m_den) <= 0)
					internalError(std::string("non-positive denominator reached ") + op);
			}

			I m_num, m_den;
	};

	template<typename I>
	Rational<I> gcd(const Rational<I> &p, const Rational<I> &q){
		return Rational<I>::gcd(p, q);
	}

	/**
	 * (g, s, t) with g = s*p + t*q.
	 * Every nonzero rational is a unit, so one of s, t can always be zero.
	 **/
	template<typename I>
	std::tuple<Rational<I>, Rational<I>, Rational<I>> gcdx(const Rational<I> &p, const Rational<I> &q){
		auto g = gcd(p, q);
		if(!p.isZero())
			return std::make_tuple(g, g / p, Rational<I>());
		else if(!q.isZero())
			return std::make_tuple(g, Rational<I>(), g / q);
		else
			return std::make_tuple(g, Rational<I>(), Rational<I>());
	}

	/**
	 * \defgroup RationalDivexact Exact division, throws DivisionByZero for a zero divisor.
	 * The quotient is always exact in a field; \p check is accepted for interface uniformity.
	 * The integer operand is not used for deduction, so any value convertible to \p I is accepted.
	 * \{
	 **/
	template<typename I>
	Rational<I> divexact(const Rational<I> &a, const Rational<I> &b, bool = true){
		return a / b;
	}

	template<typename I>
	Rational<I> divexact(const Rational<I> &a, const typename Rational<I>::Int &b, bool = true){
		return a / Rational<I>(b);
	}

	template<typename I>
	Rational<I> divexact(const typename Rational<I>::Int &a, const Rational<I> &b, bool = true){
		return Rational<I>(a) / b;
	}
	/** \} */

	//! (false, 0) if b is zero, otherwise (true, a/b)
	template<typename I>
	std::pair<bool, Rational<I>> divides(const Rational<I> &a, const Rational<I> &b){
		if(b.isZero())
			return {false, Rational<I>()};

		return {true, divexact(a, b, false)};
	}

	template<typename I>
	std::pair<Rational<I>, Rational<I>> divrem(const Rational<I> &a, const Rational<I> &b){
		return {a / b, Rational<I>()};
	}

	template<typename I>
	Rational<I> div(const Rational<I> &a, const Rational<I> &b){
		return a / b;
	}

	//! Throws NotSquare unless both numerator and denominator are perfect squares or \p check is false
	template<typename I>
	Rational<I> sqrt(const Rational<I> &a, bool check = true){
		using Ops = IntegerOps<I>;
		return Rational<I>(Ops::sqrt(a.numerator(), check), Ops::sqrt(a.denominator(), check));
	}

	template<typename I>
	bool isSquare(const Rational<I> &a){
		using Ops = IntegerOps<I>;
		return Ops::isSquare(a.numerator()) && Ops::isSquare(a.denominator());
	}

	//! 1 for a == 0; the exponential of any other rational is irrational
	template<typename I>
	Rational<I> exp(const Rational<I> &a){
		if(!a.isZero())
			throw DomainError("exp is only defined at 0 over the rationals, got " + a.toString());

		return Rational<I>(I(1));
	}

	//! 0 for a == 1
	template<typename I>
	Rational<I> log(const Rational<I> &a){
		if(!a.isOne())
			throw DomainError("log is only defined at 1 over the rationals, got " + a.toString());

		return Rational<I>();
	}

	template<typename I>
	bool isUnit(const Rational<I> &a){ return !a.isZero(); }

	template<typename I>
	Rational<I> canonicalUnit(const Rational<I> &a){ return a; }

	template<typename I>
	ExprPtr expressify(const Rational<I> &a){
		using Ops = IntegerOps<I>;
		if(Ops::isOne(a.denominator()))
			return std::make_unique<Exprs::Token>(Ops::toString(a.numerator()));

		return std::make_unique<Exprs::BinOp>(
			"//",
			std::make_unique<Exprs::Token>(Ops::toString(a.numerator())),
			std::make_unique<Exprs::Token>(Ops::toString(a.denominator()))
		);
	}

	template<typename I>
	std::ostream &operator<<(std::ostream &os, const Rational<I> &a){
		return os << a.toString();
	}

	namespace inplace{
		template<typename I>
		Rational<I> &zero(Rational<I> &a){ return a.setZero(); }

		template<typename I>
		Rational<I> &mul(Rational<I> &a, const Rational<I> &b, const Rational<I> &c){ return a.assignMul(b, c); }

		template<typename I>
		Rational<I> &add(Rational<I> &a, const Rational<I> &b, const Rational<I> &c){ return a.assignAdd(b, c); }

		template<typename I>
		Rational<I> &addeq(Rational<I> &a, const Rational<I> &b){ return a.addEq(b); }

		template<typename I>
		Rational<I> &addmul(Rational<I> &a, const Rational<I> &b, const Rational<I> &c, Rational<I> &tmp){
			return a.addMul(b, c, tmp);
		}

		template<typename I>
		Rational<I> &addmul(Rational<I> &a, const Rational<I> &b, const Rational<I> &c){ return a.addMul(b, c); }
	}
}

#endif // !ARITH_RATIONAL_HPP
