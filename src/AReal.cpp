#include <algorithm>

#include "arith/Error.hpp"

#include "Impls.hpp"

using namespace arith;

namespace{
	std::size_t s_defaultPrecision = 256;
	AReal::Rounding s_defaultRounding = AReal::Rounding::nearest;
}

std::size_t AReal::defaultPrecision() noexcept{ return s_defaultPrecision; }

void AReal::setDefaultPrecision(std::size_t bits){
	if(bits < MPFR_PREC_MIN || bits > static_cast<std::size_t>(MPFR_PREC_MAX))
		throw DomainError("precision out of range: " + std::to_string(bits));

	s_defaultPrecision = bits;
}

AReal::Rounding AReal::defaultRounding() noexcept{ return s_defaultRounding; }

void AReal::setDefaultRounding(Rounding r) noexcept{ s_defaultRounding = r; }

AReal::AReal() noexcept: m_impl(std::make_unique<Impl>()){
	m_impl->rounding = s_defaultRounding;
}

AReal::AReal(const AReal &other) noexcept: AReal(){
	mpfr_init2(m_impl->value, mpfr_get_prec(other.m_impl->value));
	mpfr_set(m_impl->value, other.m_impl->value, MPFR_RNDN);
	m_impl->rounding = other.m_impl->rounding;
}

AReal::AReal(AReal &&other) noexcept: m_impl(std::move(other.m_impl)){}

AReal::~AReal(){}

AReal::AReal(const AInt &i) noexcept: AReal(i, s_defaultPrecision){}

AReal::AReal(const AInt &i, std::size_t precision) noexcept: AReal(){
	mpfr_init2(m_impl->value, precision);
	mpfr_set_z(m_impl->value, i.m_impl->value, toMpfrRounding(m_impl->rounding));
}

AReal::AReal(std::int64_t i) noexcept: AReal(AInt(i), s_defaultPrecision){}

AReal::AReal(double r) noexcept: AReal(r, s_defaultPrecision){}

AReal::AReal(double r, std::size_t precision) noexcept: AReal(){
	mpfr_init2(m_impl->value, precision);
	mpfr_set_d(m_impl->value, r, toMpfrRounding(m_impl->rounding));
}

AReal::AReal(const std::string &s): AReal(s, s_defaultPrecision){}

AReal::AReal(const std::string &s, std::size_t precision): AReal(){
	mpfr_init2(m_impl->value, precision);
	if(mpfr_set_str(m_impl->value, s.c_str(), 10, toMpfrRounding(m_impl->rounding)) == -1)
		throw ArithError("Invalid real literal (mpfr_set_str)");
}

AReal &AReal::operator=(const AReal &other) noexcept{
	if(this == &other)
		return *this;

	if(!m_impl){
		m_impl = std::make_unique<Impl>();
		mpfr_init2(m_impl->value, mpfr_get_prec(other.m_impl->value));
	}
	else{
		mpfr_set_prec(m_impl->value, mpfr_get_prec(other.m_impl->value));
	}

	mpfr_set(m_impl->value, other.m_impl->value, MPFR_RNDN);
	m_impl->rounding = other.m_impl->rounding;
	return *this;
}

AReal &AReal::operator=(AReal &&other) noexcept{
	m_impl.swap(other.m_impl);
	return *this;
}

template<typename Fn>
void mpfrInitOp(mpfr_t rop, const mpfr_t lhs, const mpfr_t rhs, mpfr_rnd_t rnd, Fn fn){
	mpfr_init2(rop, std::max(mpfr_get_prec(lhs), mpfr_get_prec(rhs)));
	fn(rop, lhs, rhs, rnd);
}

#define DEF_AREAL_OP(op, fn)\
AReal AReal::operator op(const AReal &rhs) const noexcept{\
	AReal ret;\
	ret.m_impl->rounding = m_impl->rounding;\
	mpfrInitOp(ret.m_impl->value, m_impl->value, rhs.m_impl->value, toMpfrRounding(m_impl->rounding), fn);\
	return ret;\
}

DEF_AREAL_OP(+, mpfr_add)
DEF_AREAL_OP(-, mpfr_sub)
DEF_AREAL_OP(*, mpfr_mul)
DEF_AREAL_OP(/, mpfr_div)

AReal AReal::operator-() const noexcept{
	AReal ret;
	ret.m_impl->rounding = m_impl->rounding;
	mpfr_init2(ret.m_impl->value, mpfr_get_prec(m_impl->value));
	mpfr_neg(ret.m_impl->value, m_impl->value, MPFR_RNDN);
	return ret;
}

bool AReal::operator<(const AReal &rhs) const noexcept{
	return mpfr_less_p(m_impl->value, rhs.m_impl->value) != 0;
}

bool AReal::operator>(const AReal &rhs) const noexcept{
	return mpfr_greater_p(m_impl->value, rhs.m_impl->value) != 0;
}

bool AReal::operator<=(const AReal &rhs) const noexcept{
	return mpfr_lessequal_p(m_impl->value, rhs.m_impl->value) != 0;
}

bool AReal::operator>=(const AReal &rhs) const noexcept{
	return mpfr_greaterequal_p(m_impl->value, rhs.m_impl->value) != 0;
}

bool AReal::operator==(const AReal &rhs) const noexcept{
	return mpfr_equal_p(m_impl->value, rhs.m_impl->value) != 0;
}

bool AReal::operator!=(const AReal &rhs) const noexcept{
	return !(*this == rhs);
}

bool AReal::isZero() const noexcept{ return mpfr_zero_p(m_impl->value) != 0; }

bool AReal::isNan() const noexcept{ return mpfr_nan_p(m_impl->value) != 0; }

bool AReal::isInf() const noexcept{ return mpfr_inf_p(m_impl->value) != 0; }

int AReal::sign() const noexcept{ return mpfr_sgn(m_impl->value); }

AReal AReal::sqrt() const noexcept{
	AReal ret;
	ret.m_impl->rounding = m_impl->rounding;
	mpfr_init2(ret.m_impl->value, mpfr_get_prec(m_impl->value));
	mpfr_sqrt(ret.m_impl->value, m_impl->value, toMpfrRounding(m_impl->rounding));
	return ret;
}

std::size_t AReal::precision() const noexcept{
	return mpfr_get_prec(m_impl->value);
}

AReal::Rounding AReal::rounding() const noexcept{
	return m_impl->rounding;
}

AReal &AReal::setZero() noexcept{
	mpfr_set_si(m_impl->value, 0, toMpfrRounding(m_impl->rounding));
	return *this;
}

AReal &AReal::assignMul(const AReal &b, const AReal &c) noexcept{
	mpfr_mul(m_impl->value, b.m_impl->value, c.m_impl->value, toMpfrRounding(m_impl->rounding));
	return *this;
}

AReal &AReal::assignAdd(const AReal &b, const AReal &c) noexcept{
	mpfr_add(m_impl->value, b.m_impl->value, c.m_impl->value, toMpfrRounding(m_impl->rounding));
	return *this;
}

AReal &AReal::fma(const AReal &b, const AReal &c) noexcept{
	mpfr_fma(m_impl->value, b.m_impl->value, c.m_impl->value, m_impl->value, toMpfrRounding(m_impl->rounding));
	return *this;
}

double AReal::toDouble() const noexcept{
	return mpfr_get_d(m_impl->value, toMpfrRounding(m_impl->rounding));
}

std::string AReal::toString() const{
	if(isNan()) return "NaN";
	if(isInf()) return sign() < 0 ? "-Inf" : "Inf";
	if(isZero()) return mpfr_signbit(m_impl->value) ? "-0.0" : "0.0";

	mpfr_exp_t exponent;
	auto strPtr = mpfr_get_str(nullptr, &exponent, 10, 0, m_impl->value, MPFR_RNDN);
	std::string digits = strPtr;
	mpfr_free_str(strPtr);

	std::string str;
	if(digits[0] == '-'){
		str = "-";
		digits.erase(0, 1);
	}

	auto lastNonZero = digits.find_last_not_of('0');
	digits.erase(lastNonZero + 1);

	auto numDigits = static_cast<mpfr_exp_t>(digits.size());

	if(exponent <= 0){
		str += "0." + std::string(static_cast<std::size_t>(-exponent), '0') + digits;
	}
	else if(exponent >= numDigits){
		str += digits + std::string(static_cast<std::size_t>(exponent - numDigits), '0') + ".0";
	}
	else{
		digits.insert(static_cast<std::size_t>(exponent), ".");
		str += digits;
	}

	return str;
}
