#ifndef ARITH_AREAL_HPP
#define ARITH_AREAL_HPP 1

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "AInt.hpp"

namespace arith{
	/**
	 * Arbitrary precision binary floating point number.
	 *
	 * Every value owns a precision (in bits) and a rounding mode, both chosen when the
	 * value is created. The in-place mutators write at that precision with that rounding
	 * mode; only assignment from another AReal replaces them.
	 **/
	class AReal{
		public:
			enum class Rounding{
				nearest, towardZero, up, down, awayFromZero
			};

			AReal(const AReal &other) noexcept;
			AReal(AReal &&other) noexcept;

			~AReal();

			explicit AReal(const AInt &i) noexcept;
			AReal(const AInt &i, std::size_t precision) noexcept;
			explicit AReal(std::int64_t i) noexcept;
			explicit AReal(double r) noexcept;
			AReal(double r, std::size_t precision) noexcept;
			explicit AReal(const std::string &s);
			AReal(const std::string &s, std::size_t precision);

			AReal &operator=(const AReal &other) noexcept;
			AReal &operator=(AReal &&other) noexcept;

			AReal operator+(const AReal &rhs) const noexcept;
			AReal operator-(const AReal &rhs) const noexcept;
			AReal operator*(const AReal &rhs) const noexcept;
			AReal operator/(const AReal &rhs) const noexcept;
			AReal operator-() const noexcept;

			bool operator<(const AReal &rhs) const noexcept;
			bool operator>(const AReal &rhs) const noexcept;
			bool operator<=(const AReal &rhs) const noexcept;
			bool operator>=(const AReal &rhs) const noexcept;
			bool operator==(const AReal &rhs) const noexcept;
			bool operator!=(const AReal &rhs) const noexcept;

			bool isZero() const noexcept;
			bool isNan() const noexcept;
			bool isInf() const noexcept;
			int sign() const noexcept;

			//! NaN for negative values
			AReal sqrt() const noexcept;

			std::size_t precision() const noexcept;
			Rounding rounding() const noexcept;

			/**
			 * \defgroup ARealMutators Overwrite the stored value at the existing precision.
			 * Operands may alias *this.
			 * \{
			 **/
			AReal &setZero() noexcept;
			AReal &assignMul(const AReal &b, const AReal &c) noexcept;
			AReal &assignAdd(const AReal &b, const AReal &c) noexcept;
			//! *this = b*c + *this with a single rounding
			AReal &fma(const AReal &b, const AReal &c) noexcept;
			/** \} */

			double toDouble() const noexcept;

			std::string toString() const;

			static std::size_t defaultPrecision() noexcept;
			static void setDefaultPrecision(std::size_t bits);

			static Rounding defaultRounding() noexcept;
			static void setDefaultRounding(Rounding r) noexcept;

		private:
			AReal() noexcept;

			struct Impl;
			std::unique_ptr<Impl> m_impl;

			friend class RandState;
	};

	inline std::ostream &operator<<(std::ostream &os, const AReal &r){
		return os << r.toString();
	}
}

#endif // !ARITH_AREAL_HPP
