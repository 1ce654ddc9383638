#ifndef ARITH_FIELD_HPP
#define ARITH_FIELD_HPP 1

#include <string>

#include "fwd.hpp"

namespace arith{
	//! Descriptor of an algebraic domain
	struct Ring{
		virtual ~Ring() = default;

		virtual std::string toString() const = 0;

		virtual int characteristic() const noexcept = 0;

		//! Whether elements are represented exactly
		virtual bool isExactType() const noexcept = 0;

		//! Whether the domain has no zero divisors
		virtual bool isDomainType() const noexcept{ return true; }

		//! Ring this one is built over, nullptr if there is none
		virtual const Ring *baseRing() const noexcept{ return nullptr; }
	};

	//! Ring in which every nonzero element is a unit
	struct Field: Ring{};
}

#endif // !ARITH_FIELD_HPP
