// =============================================================================
// fastx-io - Sequence Record Implementation
// =============================================================================

#include "fastxio/io/sequence_record.h"

#include <algorithm>
#include <cctype>

namespace fastxio::io {

namespace {

[[nodiscard]] bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

SequenceRecord reverseComplementRecord(const SequenceRecord& record,
                                       const ComplementTable& table) {
    SequenceRecord result;
    result.id = record.id;
    result.description = record.description;
    result.residues = reverseComplement(record.residues, table);
    if (record.quality) {
        result.quality = std::string(record.quality->rbegin(), record.quality->rend());
    }
    return result;
}

}  // namespace

std::string reverseComplement(std::string_view residues, const ComplementTable& table) {
    std::string result;
    result.reserve(residues.size());
    for (std::size_t i = residues.size(); i > 0; --i) {
        char symbol = residues[i - 1];
        char complement = table[static_cast<unsigned char>(symbol)];
        if (complement == 0) {
            throw InvalidSymbolError(symbol, i - 1);
        }
        result.push_back(complement);
    }
    return result;
}

std::string SequenceRecord::header() const {
    if (description) {
        return id + ' ' + *description;
    }
    return id;
}

SequenceRecord SequenceRecord::dnaReverseComplement() const {
    return reverseComplementRecord(*this, kDnaComplement);
}

SequenceRecord SequenceRecord::rnaReverseComplement() const {
    return reverseComplementRecord(*this, kRnaComplement);
}

bool parseHeader(std::string_view header, std::string& id,
                 std::optional<std::string>& description) {
    auto idBegin = std::find_if_not(header.begin(), header.end(), isSpace);
    auto idEnd = std::find_if(idBegin, header.end(), isSpace);
    if (idBegin == idEnd) {
        return false;
    }
    id.assign(idBegin, idEnd);

    auto descBegin = std::find_if_not(idEnd, header.end(), isSpace);
    auto descEnd = header.end();
    while (descEnd != descBegin && isSpace(*(descEnd - 1))) {
        --descEnd;
    }
    if (descBegin != descEnd) {
        description = std::string(descBegin, descEnd);
    } else {
        description.reset();
    }
    return true;
}

}  // namespace fastxio::io
