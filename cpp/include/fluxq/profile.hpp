// profile.hpp — Nested wall-clock sections printed as they close, with a per-label summary

#pragma once

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <map>
#include <ostream>
#include <string>
#include <utility>

namespace fluxq::profile {

class Session {
  public:
    struct Total {
        double ms{0.0};
        std::size_t calls{0};
    };

    explicit Session(bool enabled, std::ostream& os) : enabled_(enabled), os_(&os) {}

    bool enabled() const noexcept { return enabled_; }

    class Section {
      public:
        Section() = default;
        Section(Session* session, std::string name)
            : session_(session), name_(std::move(name)) {
            if (!session_ || !session_->enabled_) return;
            depth_ = session_->depth_++;
            start_ = clock::now();
            active_ = true;
        }

        Section(const Section&) = delete;
        Section& operator=(const Section&) = delete;

        Section(Section&& other) noexcept { *this = std::move(other); }
        Section& operator=(Section&& other) noexcept {
            if (this == &other) return *this;
            stop();
            session_ = other.session_;
            name_ = std::move(other.name_);
            start_ = other.start_;
            depth_ = other.depth_;
            active_ = other.active_;
            other.session_ = nullptr;
            other.active_ = false;
            return *this;
        }

        ~Section() { stop(); }

        void stop() noexcept {
            if (!active_ || !session_) return;
            const double ms = std::chrono::duration<double, std::milli>(clock::now() - start_).count();
            session_->depth_--;
            session_->record(depth_, name_, ms);
            active_ = false;
        }

      private:
        using clock = std::chrono::steady_clock;

        Session* session_{nullptr};
        std::string name_;
        clock::time_point start_{};
        int depth_{0};
        bool active_{false};
    };

    Section section(std::string name) { return Section(this, std::move(name)); }

    const std::map<std::string, Total>& totals() const noexcept { return totals_; }

    // label: total ms over n calls, sorted by label
    void print_summary() const {
        if (!enabled_ || !os_ || totals_.empty()) return;
        const auto flags = os_->flags();
        const auto prec = os_->precision();
        (*os_) << "[profile] summary\n";
        for (const auto& kv : totals_) {
            (*os_) << "[profile]   " << kv.first << ": " << std::fixed << std::setprecision(3)
                   << kv.second.ms << " ms (" << kv.second.calls << " call"
                   << (kv.second.calls == 1 ? "" : "s") << ")\n";
        }
        os_->flags(flags);
        os_->precision(prec);
    }

  private:
    void record(int depth, const std::string& name, double ms) {
        auto& t = totals_[name];
        t.ms += ms;
        ++t.calls;
        if (!os_) return;
        const auto flags = os_->flags();
        const auto prec = os_->precision();
        (*os_) << "[profile] " << std::string(static_cast<std::size_t>(depth) * 2U, ' ')
               << name << ": " << std::fixed << std::setprecision(3) << ms << " ms\n";
        os_->flags(flags);
        os_->precision(prec);
    }

    bool enabled_{false};
    std::ostream* os_{nullptr};
    int depth_{0};
    std::map<std::string, Total> totals_;
};

} // namespace fluxq::profile
