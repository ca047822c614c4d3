//
// Created by aowei on 2025 10月 12.
//

#include <fsm/alphabet.hpp>
#include <fsm/error.hpp>
#include <fsm/utils.hpp>

namespace fsm {
    Alphabet::Alphabet(const std::vector<Symbol> &symbols) {
        for (const Symbol c: symbols) this->add(c);
    }

    Alphabet Alphabet::parse(const std::string_view text) {
        Alphabet alphabet;
        for (const auto token: utils::split_whitespace(text)) {
            if (token.size() != 1) {
                throw FsmError(ErrorType::MALFORMED_ALPHABET,
                               "Alphabet symbol '" + std::string(token) + "' is not a single character");
            }
            alphabet.add(token.front());
        }
        return alphabet;
    }

    bool Alphabet::contains(const Symbol symbol) const {
        return this->index.count(symbol) != 0;
    }

    std::string Alphabet::encode() const {
        std::string encoding;
        for (const Symbol c: this->symbols) {
            if (!encoding.empty()) encoding += ' ';
            encoding += c;
        }
        return encoding;
    }

    std::string Alphabet::to_string() const {
        std::string result = "{";
        for (size_t i = 0; i < this->symbols.size(); ++i) {
            if (i > 0) result += ", ";
            result += this->symbols[i];
        }
        return result + "}";
    }

    void Alphabet::add(const Symbol symbol) {
        if (this->index.insert(symbol).second) {
            this->symbols.push_back(symbol);
        }
    }
}
