#include "unicodetext.hpp"
#include <QChar>
#include <QString>
#include <QtGlobal>
#include <algorithm>
#include <iterator>

namespace pwguard::validation::unicode {

namespace {
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";
constexpr char32_t BYTE_ORDER_MARK = 0xFEFF;

struct CodePointRange {
    char32_t first;
    char32_t last;
};

// Other_Uppercase code points outside general category Lu
// (Roman numerals, circled and squared Latin capitals)
constexpr CodePointRange OTHER_UPPERCASE[] = {
    {0x2160, 0x216F},
    {0x24B6, 0x24CF},
    {0x1F130, 0x1F149},
    {0x1F150, 0x1F169},
    {0x1F170, 0x1F189},
};

bool isOtherUppercase(char32_t codePoint) {
    return std::any_of(std::begin(OTHER_UPPERCASE), std::end(OTHER_UPPERCASE),
                       [codePoint](const CodePointRange& range) {
                           return codePoint >= range.first && codePoint <= range.last;
                       });
}

QString fromUtf8(std::string_view text) {
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
#else
    return QString::fromUtf8(text.data(), static_cast<int>(text.size()));
#endif
}

} // namespace

std::u32string decodeUtf8(std::string_view text) {
    if (text.empty()) {
        return std::u32string();
    }

    // QString::fromUtf8 drops a leading BOM, U+FEFF is kept as a code point here
    if (text.substr(0, UTF8_BOM.size()) == UTF8_BOM) {
        return BYTE_ORDER_MARK + decodeUtf8(text.substr(UTF8_BOM.size()));
    }

    const auto ucs4 = fromUtf8(text).toUcs4();
    return std::u32string(ucs4.begin(), ucs4.end());
}

bool isUppercase(char32_t codePoint) {
    return QChar::isUpper(codePoint) || isOtherUppercase(codePoint);
}

bool isDecimalDigit(char32_t codePoint) {
    return QChar::isDigit(codePoint);
}

} // namespace pwguard::validation::unicode
