#include <cstring>
#include <limits>

#include "arith/Error.hpp"

#include "Impls.hpp"

using namespace arith;

namespace{
	// unsigned long may be 32 bits wide, so 64 bit values go through two halves
	void mpzSetUint64(mpz_t rop, std::uint64_t v) noexcept{
		mpz_set_ui(rop, static_cast<unsigned long>(v >> 32));
		mpz_mul_2exp(rop, rop, 32);
		mpz_add_ui(rop, rop, static_cast<unsigned long>(v & 0xffffffffu));
	}

	std::uint64_t magnitude(std::int64_t i) noexcept{
		return i < 0 ? std::uint64_t(0) - static_cast<std::uint64_t>(i) : static_cast<std::uint64_t>(i);
	}
}

AInt::AInt() noexcept: m_impl(std::make_unique<AInt::Impl>()){}

AInt::AInt(AInt &&other) noexcept: m_impl(std::move(other.m_impl)){}

AInt::AInt(const AInt &other) noexcept: AInt(){
	mpz_init_set(m_impl->value, other.m_impl->value);
}

AInt::~AInt(){}

AInt::AInt(std::int64_t i) noexcept: AInt(){
	mpz_init(m_impl->value);
	mpzSetUint64(m_impl->value, magnitude(i));
	if(i < 0)
		mpz_neg(m_impl->value, m_impl->value);
}

AInt::AInt(std::uint64_t i) noexcept: AInt(){
	mpz_init(m_impl->value);
	mpzSetUint64(m_impl->value, i);
}

AInt::AInt(const std::string &s): AInt(){
	if(mpz_init_set_str(m_impl->value, s.c_str(), 10) == -1)
		throw ArithError("Invalid integer literal (mpz_set_str)");
}

AInt &AInt::operator=(const AInt &other) noexcept{
	if(!m_impl){
		m_impl = std::make_unique<Impl>();
		mpz_init_set(m_impl->value, other.m_impl->value);
	}
	else{
		mpz_set(m_impl->value, other.m_impl->value);
	}

	return *this;
}

AInt &AInt::operator=(AInt &&other) noexcept{
	m_impl.swap(other.m_impl);
	return *this;
}

template<typename Fn>
void mpzInitOp(mpz_t rop, const mpz_t lhs, const mpz_t rhs, Fn fn){
	mpz_init(rop);
	fn(rop, lhs, rhs);
}

#define DEF_AINT_OP(op, fn)\
AInt AInt::operator op(const AInt &rhs) const noexcept{\
	AInt ret;\
	mpzInitOp(ret.m_impl->value, m_impl->value, rhs.m_impl->value, fn);\
	return ret;\
}

DEF_AINT_OP(+, mpz_add)
DEF_AINT_OP(-, mpz_sub)
DEF_AINT_OP(*, mpz_mul)

AInt AInt::operator-() const noexcept{
	AInt ret;
	mpz_init(ret.m_impl->value);
	mpz_neg(ret.m_impl->value, m_impl->value);
	return ret;
}

bool AInt::operator<(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) < 0;
}

bool AInt::operator>(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) > 0;
}

bool AInt::operator<=(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) <= 0;
}

bool AInt::operator>=(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) >= 0;
}

bool AInt::operator==(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) == 0;
}

bool AInt::operator!=(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) != 0;
}

int AInt::sign() const noexcept{
	return mpz_sgn(m_impl->value);
}

bool AInt::isZero() const noexcept{
	return mpz_sgn(m_impl->value) == 0;
}

bool AInt::isOne() const noexcept{
	return mpz_cmp_ui(m_impl->value, 1) == 0;
}

bool AInt::isEven() const noexcept{
	return mpz_even_p(m_impl->value) != 0;
}

AInt AInt::divexact(const AInt &d) const{
	if(d.isZero())
		throw DivisionByZero();

	AInt res;
	mpz_init(res.m_impl->value);
	mpz_divexact(res.m_impl->value, m_impl->value, d.m_impl->value);
	return res;
}

bool AInt::isSquare() const noexcept{
	return mpz_perfect_square_p(m_impl->value) != 0;
}

AInt AInt::sqrt(bool check) const{
	if(check && !isSquare())
		throw NotSquare("not a square: " + toString());

	if(sign() < 0)
		throw DomainError("square root of a negative integer");

	AInt res;
	mpz_init(res.m_impl->value);
	mpz_sqrt(res.m_impl->value, m_impl->value);
	return res;
}

AInt AInt::gcd(const AInt &a, const AInt &b) noexcept{
	AInt res;
	mpz_init(res.m_impl->value);
	mpz_gcd(res.m_impl->value, a.m_impl->value, b.m_impl->value);
	return res;
}

AInt &AInt::setZero() noexcept{
	mpz_set_ui(m_impl->value, 0);
	return *this;
}

AInt &AInt::assignMul(const AInt &b, const AInt &c) noexcept{
	mpz_mul(m_impl->value, b.m_impl->value, c.m_impl->value);
	return *this;
}

AInt &AInt::addMul(const AInt &b, const AInt &c) noexcept{
	mpz_addmul(m_impl->value, b.m_impl->value, c.m_impl->value);
	return *this;
}

AInt &AInt::assignDivexact(const AInt &b, const AInt &c){
	if(c.isZero())
		throw DivisionByZero();

	mpz_divexact(m_impl->value, b.m_impl->value, c.m_impl->value);
	return *this;
}

std::int64_t AInt::toInt64() const{
	static const AInt minValue(std::numeric_limits<std::int64_t>::min());
	static const AInt maxValue(std::numeric_limits<std::int64_t>::max());

	if(*this < minValue || *this > maxValue)
		throw OverflowError("integer does not fit in 64 bits: " + toString());

	mpz_t high;
	mpz_init(high);
	mpz_tdiv_q_2exp(high, m_impl->value, 32);

	// mpz_get_ui returns the low bits of the magnitude
	std::uint64_t mag = (static_cast<std::uint64_t>(mpz_get_ui(high) & 0xffffffffu) << 32)
		| (mpz_get_ui(m_impl->value) & 0xffffffffu);
	mpz_clear(high);

	return sign() < 0 ? static_cast<std::int64_t>(std::uint64_t(0) - mag) : static_cast<std::int64_t>(mag);
}

double AInt::toDouble() const noexcept{
	return mpz_get_d(m_impl->value);
}

double AInt::ratioToDouble(const AInt &num, const AInt &den){
	if(den.isZero())
		throw DivisionByZero();

	mpq_t q;
	mpq_init(q);
	mpq_set_num(q, num.m_impl->value);
	mpq_set_den(q, den.m_impl->value);
	mpq_canonicalize(q);

	auto res = mpq_get_d(q);
	mpq_clear(q);
	return res;
}

std::string AInt::toString() const{
	std::string str;
	str.resize(mpz_sizeinbase(m_impl->value, 10) + 2);
	mpz_get_str(&str[0], 10, m_impl->value);
	str.resize(std::strlen(str.c_str()));
	return str;
}
