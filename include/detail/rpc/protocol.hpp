// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <algorithm>
#include <string>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

// Line protocol between the coordinator and its callers. Every request and
// every response is a single '\n' terminated line:
//
//   AssignMapTask 0       ->  OK 3
//   AssignReduceTask 0    ->  ERR NoTasksAvailable no more reduce tasks
//   Done 0                ->  OK All tasks are done
//   Frobnicate 0          ->  ERR BadRequest unknown method Frobnicate

namespace medreduce {

namespace rpc {

char const * const assign_map_task_method    = "AssignMapTask";
char const * const assign_reduce_task_method = "AssignReduceTask";
char const * const done_method               = "Done";

char const * const no_tasks_available_error  = "NoTasksAvailable";
char const * const bad_request_error         = "BadRequest";
char const * const internal_error            = "InternalError";

struct request
{
    std::string method;
    int         args;

    request() : args(0)
    {
    }
};

struct response
{
    bool        ok;
    std::string error;      // error kind, empty on success
    std::string payload;    // result on success, message on failure

    response() : ok(false)
    {
    }
};

namespace detail {

// a payload must never break the one-line framing
inline std::string const single_line(std::string text)
{
    std::replace(text.begin(), text.end(), '\n', ' ');
    std::replace(text.begin(), text.end(), '\r', ' ');
    return text;
}

}   // namespace detail

inline std::string const format_request(std::string const &method, int const args)
{
    return method + " " + std::to_string(args) + "\n";
}

inline bool const parse_request(std::string const &line, request &req)
{
    std::vector<std::string> fields;
    if (::medreduce::detail::split_fields(line, fields).size() != 2)
        return false;

    try
    {
        req.args = boost::lexical_cast<int>(fields[1]);
    }
    catch (boost::bad_lexical_cast &)
    {
        return false;
    }
    req.method = fields[0];
    return true;
}

// a task index is a plain unsigned decimal, never signed or padded
inline bool const parse_task_index(std::string const &payload, size_t &index)
{
    if (payload.empty()  ||  !boost::algorithm::all(payload, boost::algorithm::is_digit()))
        return false;

    try
    {
        index = boost::lexical_cast<size_t>(payload);
    }
    catch (boost::bad_lexical_cast &)
    {
        return false;
    }
    return true;
}

inline std::string const format_success(std::string const &payload)
{
    return "OK " + detail::single_line(payload) + "\n";
}

inline std::string const format_failure(std::string const &error, std::string const &message)
{
    return "ERR " + error + " " + detail::single_line(message) + "\n";
}

inline bool const parse_response(std::string const &line, response &resp)
{
    std::string const trimmed = boost::algorithm::trim_right_copy(line);
    if (trimmed == "OK"  ||  boost::algorithm::starts_with(trimmed, "OK "))
    {
        resp.ok      = true;
        resp.error.clear();
        resp.payload = (trimmed.length() > 3)? trimmed.substr(3) : std::string();
        return true;
    }

    if (boost::algorithm::starts_with(trimmed, "ERR "))
    {
        std::string const rest = trimmed.substr(4);
        std::string::size_type const space = rest.find(' ');

        resp.ok      = false;
        resp.error   = rest.substr(0, space);
        resp.payload = (space == std::string::npos)? std::string() : rest.substr(space+1);
        return !resp.error.empty();
    }

    return false;
}

}   // namespace rpc

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
