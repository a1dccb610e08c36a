#include <statex/runtime/observers/propagation_trace.h>
#include <statex/types/field.h>
#include <statex/util/date_time.h>
#include <fmt/format.h>

#include <cstdio>

namespace statex {

    PropagationTrace::PropagationTrace(const std::optional<std::string> &filter, bool dirty, bool flush, bool use_stderr)
        : _filter(filter), _dirty(dirty), _flush(flush), _use_stderr(use_stderr) {
    }

    void PropagationTrace::_print(const std::string &msg) {
        auto time_us = now().time_since_epoch().count();
        fmt::print(_use_stderr ? stderr : stdout, "[{}] [statex] {}\n", time_us, msg);
        ++_lines_written;
    }

    bool PropagationTrace::_should_log(const Field &field) const {
        return !_filter || field.key().find(*_filter) != std::string::npos;
    }

    void PropagationTrace::on_dirty(const Field &field, Provenance source) {
        if (!_dirty || !_should_log(field)) { return; }
        _print(fmt::format("dirty {} src={}", field.key(), source));
    }

    void PropagationTrace::on_before_flush(const Field &field) {
        if (!_flush || !_should_log(field)) { return; }
        _print(fmt::format("flush {} listeners={}", field.key(), field.listener_count()));
    }

    void PropagationTrace::on_after_flush(const Field &field) {
        if (!_flush || !_should_log(field)) { return; }
        _print(fmt::format("flushed {}", field.key()));
    }

} // namespace statex
