#pragma once

#include <utility>

#include "core/model/types.hpp"

namespace lift {

// Latest suggestion set; each set() replaces the previous one wholesale.
class SuggestionStore {
public:
  void set(SuggestionSet suggestions) { suggestions_ = std::move(suggestions); }

  [[nodiscard]] const SuggestionSet& get() const { return suggestions_; }
  [[nodiscard]] bool empty() const { return suggestions_.empty(); }

  friend bool operator==(const SuggestionStore&, const SuggestionStore&) = default;

private:
  SuggestionSet suggestions_;
};

}  // namespace lift
