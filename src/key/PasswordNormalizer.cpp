#include "itemcrypt/key/PasswordNormalizer.hpp"

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/ustring.h>
#include <unicode/utypes.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace itemcrypt::key
{
namespace
{

[[nodiscard]] bool isTrimmable(UChar32 c) noexcept
{
    return u_hasBinaryProperty(c, UCHAR_WHITE_SPACE) != 0;
}

void trimWhiteSpace(icu::UnicodeString& s)
{
    std::int32_t end{ s.length() };
    while (end > 0)
    {
        const std::int32_t prev{ s.moveIndex32(end, -1) };
        if (!isTrimmable(s.char32At(prev)))
        {
            break;
        }
        end = prev;
    }

    std::int32_t start{};
    while (start < end && isTrimmable(s.char32At(start)))
    {
        start = s.moveIndex32(start, 1);
    }

    s.retainBetween(start, end);
}

[[nodiscard]] itemcrypt::security::SecureString toUtf8(const icu::UnicodeString& s)
{
    UErrorCode status{ U_ZERO_ERROR };
    std::int32_t needed{};
    u_strToUTF8(nullptr, 0, &needed, s.getBuffer(), s.length(), &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status))
    {
        throw std::runtime_error(std::string{ "normalizePassword: u_strToUTF8 failed: " } + u_errorName(status));
    }

    itemcrypt::security::SecureString out(static_cast<std::size_t>(needed));
    if (needed == 0)
    {
        return out;
    }

    status = U_ZERO_ERROR;
    std::int32_t written{};
    u_strToUTF8(out.data(), needed, &written, s.getBuffer(), s.length(), &status);
    // Exact-fit output is reported as U_STRING_NOT_TERMINATED_WARNING, which is not a failure.
    if (U_FAILURE(status) || written != needed)
    {
        throw std::runtime_error(std::string{ "normalizePassword: u_strToUTF8 failed: " } + u_errorName(status));
    }
    return out;
}

} // namespace

itemcrypt::security::SecureString normalizePassword(std::string_view utf8)
{
    if (utf8.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()))
    {
        throw std::invalid_argument("normalizePassword: password too large");
    }

    UErrorCode status{ U_ZERO_ERROR };
    const icu::Normalizer2* nfkd{ icu::Normalizer2::getNFKDInstance(status) };
    if (U_FAILURE(status) || nfkd == nullptr)
    {
        throw std::runtime_error(std::string{ "normalizePassword: NFKD unavailable: " } + u_errorName(status));
    }

    icu::UnicodeString text{ icu::UnicodeString::fromUTF8(
        icu::StringPiece{ utf8.data(), static_cast<std::int32_t>(utf8.size()) }) };
    trimWhiteSpace(text);

    icu::UnicodeString decomposed{ nfkd->normalize(text, status) };
    if (U_FAILURE(status))
    {
        throw std::runtime_error(std::string{ "normalizePassword: normalize failed: " } + u_errorName(status));
    }

    return toUtf8(decomposed);
}

} // namespace itemcrypt::key
