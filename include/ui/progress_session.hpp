#pragma once

#include "engine/operation_controller.hpp"
#include "ui/key_decoder.hpp"
#include "util/log_sink.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <unistd.h>

namespace ddi {

// Event loop for one run: polls the status pipe and the keyboard, pumps the
// controller and redraws. Full-screen when both ends are terminals, one
// summary line per interval otherwise.
class ProgressSession {
  public:
    struct Options {
        std::chrono::milliseconds render_interval{250};
        bool color = true;
        int in_fd = STDIN_FILENO;
        int out_fd = STDOUT_FILENO;
    };

    ProgressSession(OperationController& ctrl, LogSink& log, Options opt);

    // Returns once the run is terminal and, on a terminal, the result screen
    // has been dismissed.
    Result Run();

    void HandleKey(KeyEvent key);
    std::size_t LogScroll() const { return log_scroll_; }

  private:
    bool Interactive() const { return interactive_; }
    bool ReadInput();
    Result Draw(std::chrono::steady_clock::time_point now);
    Result WaitForDismiss();
    int PageSize() const;

    OperationController& ctrl_;
    LogSink& log_;
    Options opt_;
    bool interactive_ = false;
    bool dismissed_ = false;
    int height_ = 24;
    std::size_t log_scroll_ = 0;
    KeyDecoder keys_;
};

} // namespace ddi
