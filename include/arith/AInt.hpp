#ifndef ARITH_AINT_HPP
#define ARITH_AINT_HPP 1

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

namespace arith{
	//! Arbitrary precision integer
	class AInt{
		public:
			AInt(const AInt &other) noexcept;
			AInt(AInt &&other) noexcept;

			~AInt();

			explicit AInt(int i) noexcept: AInt(static_cast<std::int64_t>(i)){}
			explicit AInt(std::int64_t i) noexcept;
			explicit AInt(std::uint64_t ui) noexcept;
			explicit AInt(const std::string &s);

			AInt &operator=(const AInt &other) noexcept;
			AInt &operator=(AInt &&other) noexcept;

			AInt operator+(const AInt &rhs) const noexcept;
			AInt operator-(const AInt &rhs) const noexcept;
			AInt operator*(const AInt &rhs) const noexcept;
			AInt operator-() const noexcept;

			bool operator<(const AInt &rhs) const noexcept;
			bool operator>(const AInt &rhs) const noexcept;
			bool operator<=(const AInt &rhs) const noexcept;
			bool operator>=(const AInt &rhs) const noexcept;
			bool operator==(const AInt &rhs) const noexcept;
			bool operator!=(const AInt &rhs) const noexcept;

			//! -1, 0 or 1
			int sign() const noexcept;

			bool isZero() const noexcept;
			bool isOne() const noexcept;
			bool isEven() const noexcept;

			//! Quotient of a division known to be exact
			AInt divexact(const AInt &d) const;

			bool isSquare() const noexcept;

			/**
			 * Integer square root.
			 * Throws NotSquare if \p check is set and the value is not a perfect square
			 * (negative values never are),
			 * DomainError for negative values when unchecked.
			 **/
			AInt sqrt(bool check = true) const;

			//! Non-negative greatest common divisor
			static AInt gcd(const AInt &a, const AInt &b) noexcept;

			/**
			 * \defgroup AIntMutators Overwrite the stored value, reusing its limbs.
			 * Operands may alias *this.
			 * \{
			 **/
			AInt &setZero() noexcept;
			AInt &assignMul(const AInt &b, const AInt &c) noexcept;
			AInt &addMul(const AInt &b, const AInt &c) noexcept;
			AInt &assignDivexact(const AInt &b, const AInt &c);
			/** \} */

			std::string toString() const;

			//! Value as a signed 64 bit integer, throws OverflowError if it does not fit
			std::int64_t toInt64() const;

			//! Nearest double towards zero; values beyond the double range give +-Inf
			double toDouble() const noexcept;

			//! num/den as a double without converting either operand first, throws DivisionByZero if den is zero
			static double ratioToDouble(const AInt &num, const AInt &den);

		private:
			AInt() noexcept;

			struct Impl;
			std::unique_ptr<Impl> m_impl;

			friend class AReal;
			friend class RandState;
	};

	inline std::ostream &operator<<(std::ostream &os, const AInt &i){
		return os << i.toString();
	}
}

#endif // !ARITH_AINT_HPP
