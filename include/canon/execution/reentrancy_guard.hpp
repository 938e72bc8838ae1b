#pragma once

namespace canon::execution {

/// Mutual-exclusion flag for a component's mutating entry points.
///
/// One flag is shared by every guarded entry point of a component, so a
/// nested call into any of them (for example from inside a value transfer)
/// is refused rather than interleaved.
class reentrancy_guard final {
 public:
  /// Scoped acquisition; released on every exit path.
  class scope final {
   public:
    explicit scope(reentrancy_guard& guard) : guard_{guard} {
      acquired_ = !guard_.entered_;
      if (acquired_) {
        guard_.entered_ = true;
      }
    }

    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;
    scope(scope&&) = delete;
    scope& operator=(scope&&) = delete;

    ~scope() {
      if (acquired_) {
        guard_.entered_ = false;
      }
    }

    bool acquired() const { return acquired_; }

   private:
    reentrancy_guard& guard_;
    bool acquired_{false};
  };

  bool entered() const { return entered_; }

 private:
  bool entered_{false};
};

}  // namespace canon::execution
