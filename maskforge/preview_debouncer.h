#pragma once

#include <chrono>
#include <functional>

#include "job_pool.h"

//////////////////////////////////////////////////////////////////////
// live preview: only the newest request survives the settle time, anything older is aborted

struct preview_debouncer
{
    using result_callback = std::function<void(maskforge_lib::render_request const &, maskforge_lib::render_result const &)>;

    preview_debouncer(job_pool &pool, result_callback callback, std::chrono::milliseconds settle_time = std::chrono::milliseconds(200));

    void post(maskforge_lib::render_request const &request);

    void cancel();

    // blocks until the last posted preview has been delivered or dropped
    void wait_idle();

    job_pool &pool;
    result_callback callback;
    std::chrono::milliseconds settle_time;
};
