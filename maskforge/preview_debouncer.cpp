#include <condition_variable>
#include <mutex>
#include <thread>

#include "maskforge_log.h"
#include "preview_debouncer.h"

LOG_CONTEXT("preview", info);

//////////////////////////////////////////////////////////////////////

preview_debouncer::preview_debouncer(job_pool &pool, result_callback callback, std::chrono::milliseconds settle_time)
    : pool(pool), callback(std::move(callback)), settle_time(settle_time)
{
}

//////////////////////////////////////////////////////////////////////

void preview_debouncer::post(maskforge_lib::render_request const &request)
{
    pool.cancel(job_flag_preview);

    pool.post(job_flag_preview, [this, request](std::stop_token st) {
        {
            std::mutex wait_mutex;
            std::condition_variable_any wait_cv;
            std::unique_lock lock(wait_mutex);
            wait_cv.wait_for(lock, st, settle_time, [] { return false; });
        }
        if(st.stop_requested()) {
            LOG_DEBUG("preview superseded before it started");
            return;
        }
        maskforge_lib::render_result result = maskforge_lib::render(request);
        if(st.stop_requested()) {
            LOG_DEBUG("preview superseded while rendering");
            return;
        }
        callback(request, result);
    });
}

//////////////////////////////////////////////////////////////////////

void preview_debouncer::cancel()
{
    pool.cancel(job_flag_preview);
}

//////////////////////////////////////////////////////////////////////

void preview_debouncer::wait_idle()
{
    while(pool.busy(job_flag_preview)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}
