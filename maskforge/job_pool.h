#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_set>
#include <vector>

#include "maskforge_render.h"

//////////////////////////////////////////////////////////////////////
// jobs carry flags so a whole class of them can be cancelled at once

enum job_flags : uint32_t
{
    job_flag_render = 1,
    job_flag_preview = 2,

    job_flag_all = 0xffffffff
};

//////////////////////////////////////////////////////////////////////

struct job_pool
{
    //////////////////////////////////////////////////////////////////////
    // type erased void(std::stop_token), move only so it can own a promise

    struct job_function
    {
        struct callable
        {
            virtual ~callable() = default;
            virtual void invoke(std::stop_token stop) = 0;
        };

        template <typename F> struct holder : callable
        {
            F fn;

            explicit holder(F f) : fn(std::move(f))
            {
            }

            void invoke(std::stop_token stop) override
            {
                fn(stop);
            }
        };

        std::unique_ptr<callable> target;

        job_function() = default;

        template <typename F> explicit job_function(F &&f) : target(std::make_unique<holder<std::decay_t<F>>>(std::forward<F>(f)))
        {
        }

        void operator()(std::stop_token stop) const
        {
            if(target != nullptr) {
                target->invoke(stop);
            }
        }
    };

    //////////////////////////////////////////////////////////////////////

    struct job
    {
        job_function function;
        uint32_t flags{};
        std::stop_source stop_source;
    };


    //////////////////////////////////////////////////////////////////////

    job_pool() = default;
    job_pool(job_pool const &) = delete;
    job_pool &operator=(job_pool const &) = delete;

    ~job_pool();

    // one less than the core count, at least one
    static size_t default_thread_count();

    void start(size_t thread_count = default_thread_count());

    // cancels everything, then joins the threads
    void stop();

    // queued jobs matching the mask are dropped, running ones get a stop request
    void cancel(uint32_t mask);

    // anything matching the mask queued or running
    bool busy(uint32_t mask);

    template <typename F> void post(uint32_t flags, F &&fn)
    {
        {
            std::lock_guard lock(mutex);
            queue.push_back(job{ job_function(std::forward<F>(fn)), flags, std::stop_source{} });
        }
        wakeup.notify_one();
    }

    // the future always gets a result, error_cancelled if the job was dropped or stopped
    std::future<maskforge_lib::render_result> submit(maskforge_lib::render_request const &request, uint32_t flags = job_flag_render);

    //////////////////////////////////////////////////////////////////////

    void run(std::stop_token pool_stop);

    std::vector<std::jthread> threads;
    std::deque<job> queue;
    std::unordered_set<job *> running;
    std::mutex mutex;
    std::condition_variable_any wakeup;
};
