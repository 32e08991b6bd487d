// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

namespace medreduce {

namespace schedule_policy {

// Every task in turn on the calling thread, stopping at the first failure.
// Handy under a debugger.
template<typename Job>
class sequential
{
  public:
    void operator()(Job &job, results &result)
    {
        map(job, result);
        reduce(job, result);

        result.counters.num_result_files = job.number_of_reduce_tasks();
    }

    void map(Job &job, results &result)
    {
        auto const start_time(std::chrono::system_clock::now());

        for (size_t task=0; task<job.number_of_map_tasks(); ++task)
        {
            ++result.counters.actual_map_tasks;

            std::exception_ptr error;
            if (!job.run_map_task(task, result, error))
            {
                result.map_runtime = std::chrono::system_clock::now() - start_time;
                std::rethrow_exception(error);
            }
        }
        result.map_runtime = std::chrono::system_clock::now() - start_time;
    }

    void reduce(Job &job, results &result)
    {
        auto const start_time(std::chrono::system_clock::now());

        for (size_t task=0; task<job.number_of_reduce_tasks(); ++task)
        {
            ++result.counters.actual_reduce_tasks;

            std::exception_ptr error;
            if (!job.run_reduce_task(task, result, error))
            {
                result.reduce_runtime = std::chrono::system_clock::now() - start_time;
                std::rethrow_exception(error);
            }
        }
        result.reduce_runtime = std::chrono::system_clock::now() - start_time;
    }
};

}   // namespace schedule_policy

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
