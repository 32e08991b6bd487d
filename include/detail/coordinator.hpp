// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

namespace medreduce {

// Owns the map and reduce task pools of a run and its completion gate.
// Leases may arrive from any number of threads (the rpc server calls in from
// its own); each index is handed out once.
//
// state: initialized -> leasing (first lease) -> completed (done), and
// completed is final
class coordinator : detail::noncopyable
{
  public:
    typedef enum { initialized, leasing, completed } state_t;

    explicit coordinator(specification const &spec)
      : specification_(spec),
        map_tasks_("map", spec.map_tasks),
        reduce_tasks_("reduce", spec.reduce_tasks),
        state_(initialized)
    {
    }

    // the argument is unused, it only mirrors the remote call
    size_t const assign_map_task(int const /*args*/)
    {
        start_leasing();
        return map_tasks_.lease();
    }

    size_t const assign_reduce_task(int const /*args*/)
    {
        start_leasing();
        return reduce_tasks_.lease();
    }

    // safe to call more than once, only the first call fires the gate
    std::string const done(int const /*args*/)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = completed;
        }

        // a second fire is a no-op
        gate_.fire();
        return "All tasks are done";
    }

    void wait() const
    {
        gate_.wait();
    }

    template<typename Rep, typename Period>
    bool const wait_for(std::chrono::duration<Rep, Period> const &timeout) const
    {
        return gate_.wait_for(timeout);
    }

    state_t const state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    specification const &spec() const
    {
        return specification_;
    }

    task_pool const &map_tasks() const
    {
        return map_tasks_;
    }

    task_pool const &reduce_tasks() const
    {
        return reduce_tasks_;
    }

  private:
    void start_leasing()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == initialized)
            state_ = leasing;
    }

  private:
    specification const &specification_;
    task_pool            map_tasks_;
    task_pool            reduce_tasks_;
    completion_gate      gate_;
    mutable std::mutex   mutex_;
    state_t              state_;
};

}   // namespace medreduce

// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.
