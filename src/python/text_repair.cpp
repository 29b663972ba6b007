#include "python/text_repair.h"
#include "utils/logger.h"

namespace snipguard {
namespace python {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

}

ValidationReport PassthroughRepairer::validate(const std::string&) const {
    return ValidationReport{};
}

RepairReport PassthroughRepairer::repair(const std::string& text) const {
    RepairReport report;
    report.fixedText = text;
    return report;
}

std::string normalizeColumnKeys(const std::string& code) {
    static const std::string kOpen = "df[";
    std::string out;
    out.reserve(code.size());
    size_t last = 0;
    size_t changed = 0;
    size_t pos = code.find(kOpen);
    while (pos != std::string::npos) {
        size_t quotePos = pos + kOpen.size();
        char q = quotePos < code.size() ? code[quotePos] : '\0';
        if (q == '\'' || q == '"') {
            size_t keyBegin = quotePos + 1;
            size_t keyEnd = code.find_first_of("'\"\n", keyBegin);
            if (keyEnd != std::string::npos && code[keyEnd] == q &&
                keyEnd + 1 < code.size() && code[keyEnd + 1] == ']') {
                std::string key = code.substr(keyBegin, keyEnd - keyBegin);
                std::string stripped = trim(key);
                out.append(code, last, keyBegin - last);
                out += stripped;
                last = keyEnd;
                if (stripped != key) ++changed;
                pos = code.find(kOpen, keyEnd + 2);
                continue;
            }
        }
        pos = code.find(kOpen, pos + 1);
    }
    out.append(code, last, std::string::npos);
    if (changed > 0) {
        SG_DEBUG("sandbox", "normalized " + std::to_string(changed) + " column key(s)");
    }
    return out;
}

}
}
