#pragma once

#include "geoclean/types.hpp"

#include <initializer_list>
#include <set>
#include <string>

namespace geoclean {

    // Spellings that mean "no value". Missing cells and numeric NaN are always null.
    class NullValueSet {
      private:
        std::set<std::string> spellings_;

      public:
        NullValueSet();
        NullValueSet(std::initializer_list<std::string> spellings);

        static NullValueSet defaults();

        void add(const std::string &spelling) { spellings_.insert(spelling); }
        void remove(const std::string &spelling) { spellings_.erase(spelling); }
        void clear() { spellings_.clear(); }

        bool contains(const std::string &text) const { return spellings_.count(text) > 0; }
        bool contains(const char *text) const { return contains(std::string(text)); }
        bool contains(const Cell &cell) const;

        size_t size() const { return spellings_.size(); }
        const std::set<std::string> &spellings() const { return spellings_; }
    };

} // namespace geoclean
