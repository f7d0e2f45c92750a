#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace jbind
{

  // Arbitrary length integer kept as its decimal digits
  class BigInteger final
  {
  public:
    BigInteger() = default;

    BigInteger(int64_t value) // NOLINT(google-explicit-constructor)
    {
      char buff[32] = {};
      auto result = std::to_chars(buff, buff + sizeof(buff), value);
      assignDigits(std::string_view(buff, result.ptr - buff));
    }

    // Accepts an optional '-' followed by decimal digits
    static bool Parse(std::string_view text, BigInteger& out)
    {
      std::string_view digits = text;
      if (!digits.empty() && digits.front() == '-')
        digits.remove_prefix(1);

      if (digits.empty())
        return false;

      for (char ch : digits)
      {
        if (ch < '0' || ch > '9')
          return false;
      }

      out.assignDigits(text);
      return true;
    }

    bool negative() const noexcept { return m_negative; }
    bool isZero() const noexcept { return m_digits == "0"; }

    // Magnitude digits without sign or leading zeros
    const std::string& digits() const noexcept { return m_digits; }

    std::string toString() const { return m_negative ? "-" + m_digits : m_digits; }

    int compare(const BigInteger& other) const noexcept
    {
      if (m_negative != other.m_negative)
        return m_negative ? -1 : 1;

      int magnitude = 0;
      if (m_digits.size() != other.m_digits.size())
        magnitude = m_digits.size() < other.m_digits.size() ? -1 : 1;
      else if (int cmp = m_digits.compare(other.m_digits); cmp != 0)
        magnitude = cmp < 0 ? -1 : 1;

      return m_negative ? -magnitude : magnitude;
    }

    bool operator==(const BigInteger& other) const noexcept { return m_negative == other.m_negative && m_digits == other.m_digits; }
    bool operator<(const BigInteger& other) const noexcept { return compare(other) < 0; }

  private:
    void assignDigits(std::string_view text)
    {
      m_negative = !text.empty() && text.front() == '-';
      if (m_negative)
        text.remove_prefix(1);

      while (text.size() > 1 && text.front() == '0')
        text.remove_prefix(1);

      m_digits = std::string(text);
      if (m_digits == "0")
        m_negative = false;
    }

    bool m_negative = false;
    std::string m_digits = "0";
  };

  //---------------------------------------------------------------------------------------------------------------------
  // Decimal number as unscaled integer and scale: value = unscaled * 10^-scale
  class BigDecimal final
  {
  public:
    BigDecimal() = default;

    BigDecimal(int64_t value) // NOLINT(google-explicit-constructor)
      : m_unscaled(value)
    {}

    BigDecimal(BigInteger unscaled, int32_t scale)
      : m_unscaled(std::move(unscaled))
      , m_scale(scale)
    {}

    // Accepts a JSON number literal
    static bool Parse(std::string_view text, BigDecimal& out)
    {
      size_t pos = 0;
      std::string unscaled;

      if (pos < text.size() && text[pos] == '-')
        unscaled += text[pos++];

      size_t intStart = pos;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
        unscaled += text[pos++];

      if (pos == intStart)
        return false;

      int64_t scale = 0;
      if (pos < text.size() && text[pos] == '.')
      {
        size_t fracStart = ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
          unscaled += text[pos++];

        if (pos == fracStart)
          return false;

        scale = int64_t(pos - fracStart);
      }

      if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E'))
      {
        ++pos;
        if (pos < text.size() && text[pos] == '+')
          ++pos;

        int64_t exponent = 0;
        auto result = std::from_chars(text.data() + pos, text.data() + text.size(), exponent);
        if (result.ec != std::errc() || result.ptr == text.data() + pos)
          return false;

        pos = result.ptr - text.data();
        scale -= exponent;
      }

      if (pos != text.size() || scale > INT32_MAX || scale < INT32_MIN)
        return false;

      BigInteger integer;
      if (!BigInteger::Parse(unscaled, integer))
        return false;

      // A zero with a fraction or exponent keeps its sign
      bool negativeZero = integer.isZero() && unscaled.front() == '-' && scale != 0;

      out = BigDecimal(std::move(integer), int32_t(scale));
      out.m_negativeZero = negativeZero;
      return true;
    }

    const BigInteger& unscaled() const noexcept { return m_unscaled; }
    int32_t scale() const noexcept { return m_scale; }
    bool negative() const noexcept { return m_unscaled.negative() || m_negativeZero; }

    // Plain notation when the scale is non negative and the adjusted exponent is at least -6, scientific otherwise
    std::string toString() const
    {
      const std::string& coeff = m_unscaled.digits();
      int64_t adjusted = -int64_t(m_scale) + int64_t(coeff.size()) - 1;

      std::string result = negative() ? "-" : "";
      if (m_scale == 0)
      {
        result += coeff;
      }
      else if (m_scale > 0 && adjusted >= -6)
      {
        if (coeff.size() > size_t(m_scale))
        {
          result += coeff.substr(0, coeff.size() - m_scale);
          result += '.';
          result += coeff.substr(coeff.size() - m_scale);
        }
        else
        {
          result += "0.";
          result += std::string(size_t(m_scale) - coeff.size(), '0');
          result += coeff;
        }
      }
      else
      {
        result += coeff[0];
        if (coeff.size() > 1)
        {
          result += '.';
          result += coeff.substr(1);
        }

        if (adjusted != 0)
        {
          result += 'E';
          if (adjusted > 0)
            result += '+';

          result += std::to_string(adjusted);
        }
      }

      return result;
    }

    // Integral when no digits follow the decimal point
    bool isIntegral() const noexcept { return m_scale <= 0; }

    bool operator==(const BigDecimal& other) const noexcept
    {
      return m_scale == other.m_scale && m_unscaled == other.m_unscaled && m_negativeZero == other.m_negativeZero;
    }

  private:
    BigInteger m_unscaled;
    int32_t m_scale = 0;
    bool m_negativeZero = false;
  };

} // namespace jbind
