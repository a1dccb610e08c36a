#pragma once

#include <statex/runtime/field_clearing_coordinator.h>
#include <statex/statex_export.h>
#include <optional>
#include <string>

namespace statex {

    /**
     * @brief Logs out the propagation steps as fields are marked dirty and flushed.
     *
     * Voluminous, but helpful when tracing down unexpected notifications. Attach it to a coordinator with
     * FieldClearingCoordinator::add_observer.
     */
    class STATEX_EXPORT PropagationTrace : public PropagationObserver {
    public:
        /**
         * @param filter Restricts the report to fields whose key contains the filter (substring match)
         * @param dirty Log dirty marks
         * @param flush Log flushes
         * @param use_stderr Write to stderr, otherwise stdout
         */
        explicit PropagationTrace(const std::optional<std::string> &filter = std::nullopt, bool dirty = true,
                                  bool flush = true, bool use_stderr = true);

        void on_dirty(const Field &field, Provenance source) override;
        void on_before_flush(const Field &field) override;
        void on_after_flush(const Field &field) override;

        [[nodiscard]] std::size_t lines_written() const { return _lines_written; }

    private:
        std::optional<std::string> _filter;
        bool _dirty;
        bool _flush;
        bool _use_stderr;
        std::size_t _lines_written{0};

        void _print(const std::string &msg);
        [[nodiscard]] bool _should_log(const Field &field) const;
    };

} // namespace statex
