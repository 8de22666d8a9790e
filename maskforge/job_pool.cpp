#include <algorithm>

#include "job_pool.h"
#include "maskforge_log.h"

LOG_CONTEXT("job_pool", info);

//////////////////////////////////////////////////////////////////////

namespace
{
    using namespace maskforge_lib;

    //////////////////////////////////////////////////////////////////////
    // a dropped job never calls fulfil, so the destructor answers for it

    struct render_promise
    {
        std::promise<render_result> promise;
        bool fulfilled{ false };

        void fulfil(render_result &&result)
        {
            fulfilled = true;
            promise.set_value(std::move(result));
        }

        ~render_promise()
        {
            if(!fulfilled) {
                render_result result;
                result.error = maskforge_error(error_cancelled, "Cancelled");
                promise.set_value(std::move(result));
            }
        }
    };

}    // namespace

//////////////////////////////////////////////////////////////////////

job_pool::~job_pool()
{
    stop();
}

//////////////////////////////////////////////////////////////////////

size_t job_pool::default_thread_count()
{
    unsigned int cores = std::thread::hardware_concurrency();
    if(cores < 2) {
        return 1;
    }
    return cores - 1;
}

//////////////////////////////////////////////////////////////////////

void job_pool::start(size_t thread_count)
{
    LOG_DEBUG("starting {} threads", thread_count);
    threads.reserve(threads.size() + thread_count);
    while(thread_count-- != 0) {
        threads.emplace_back([this](std::stop_token pool_stop) { run(pool_stop); });
    }
}

//////////////////////////////////////////////////////////////////////

void job_pool::stop()
{
    cancel(job_flag_all);
    for(auto &t : threads) {
        t.request_stop();
    }
    wakeup.notify_all();
    threads.clear();
}

//////////////////////////////////////////////////////////////////////

bool job_pool::busy(uint32_t mask)
{
    std::lock_guard lock(mutex);
    auto matches = [mask](job const &j) { return (j.flags & mask) != 0; };
    if(std::any_of(queue.begin(), queue.end(), matches)) {
        return true;
    }
    return std::any_of(running.begin(), running.end(), [&](job const *j) { return matches(*j); });
}

//////////////////////////////////////////////////////////////////////

void job_pool::cancel(uint32_t mask)
{
    // destroyed after the lock is released, a job's captures may do work when they go
    std::vector<job> dropped;
    {
        std::lock_guard lock(mutex);

        for(auto it = queue.begin(); it != queue.end();) {
            if((it->flags & mask) != 0) {
                it->stop_source.request_stop();
                dropped.push_back(std::move(*it));
                it = queue.erase(it);
            } else {
                ++it;
            }
        }

        for(job *j : running) {
            if((j->flags & mask) != 0) {
                j->stop_source.request_stop();
            }
        }
    }
    if(!dropped.empty()) {
        LOG_DEBUG("dropped {} queued jobs", dropped.size());
    }
}

//////////////////////////////////////////////////////////////////////

void job_pool::run(std::stop_token pool_stop)
{
    LOG_CONTEXT("worker", info);

    while(!pool_stop.stop_requested()) {

        std::unique_ptr<job> current;
        {
            std::unique_lock lock(mutex);
            if(!wakeup.wait(lock, pool_stop, [this] { return !queue.empty(); })) {
                break;
            }
            current = std::make_unique<job>(std::move(queue.front()));
            queue.pop_front();
            running.insert(current.get());
        }

        LOG_DEBUG("job {:x} begins", current->flags);
        current->function(current->stop_source.get_token());
        LOG_DEBUG("job {:x} done", current->flags);

        {
            std::lock_guard lock(mutex);
            running.erase(current.get());
        }
    }
}

//////////////////////////////////////////////////////////////////////

std::future<render_result> job_pool::submit(render_request const &request, uint32_t flags)
{
    auto promise = std::make_shared<render_promise>();
    std::future<render_result> future = promise->promise.get_future();

    post(flags, [request, promise](std::stop_token stop) {
        if(stop.stop_requested()) {
            return;
        }
        render_result result = render(request);
        if(!stop.stop_requested()) {
            promise->fulfil(std::move(result));
        }
    });
    return future;
}
