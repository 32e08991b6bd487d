// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <istream>
#include <boost/asio.hpp>

namespace medreduce {

namespace rpc {

// Blocking caller of a remote coordinator over one connection. Transport
// failures surface as boost::system::system_error.
class client : ::medreduce::detail::noncopyable
{
  public:
    client(std::string const &host, unsigned short const port)
      : socket_(io_context_)
    {
        boost::asio::ip::tcp::resolver resolver(io_context_);
        boost::asio::connect(socket_, resolver.resolve(host, std::to_string(port)));
    }

    // throws no_tasks_available once the remote map pool is empty
    size_t const assign_map_task(int const args = 0)
    {
        return to_task_index(call(assign_map_task_method, args));
    }

    size_t const assign_reduce_task(int const args = 0)
    {
        return to_task_index(call(assign_reduce_task_method, args));
    }

    std::string const done(int const args = 0)
    {
        return call(done_method, args);
    }

    std::string const call(std::string const &method, int const args)
    {
        std::string const request = format_request(method, args);
        boost::asio::write(socket_, boost::asio::buffer(request));
        boost::asio::read_until(socket_, buffer_, '\n');

        std::istream in(&buffer_);
        std::string line;
        std::getline(in, line);

        response resp;
        if (!parse_response(line, resp))
            BOOST_THROW_EXCEPTION(rpc_error("malformed response \"" + line + "\" to " + method));
        else if (resp.ok)
            return resp.payload;
        else if (resp.error == no_tasks_available_error)
            BOOST_THROW_EXCEPTION(no_tasks_available(resp.payload));

        BOOST_THROW_EXCEPTION(rpc_error(method + " failed: " + resp.error + " " + resp.payload));
    }

  private:
    static size_t const to_task_index(std::string const &payload)
    {
        size_t index = 0;
        if (!parse_task_index(payload, index))
            BOOST_THROW_EXCEPTION(rpc_error("task index expected, received \"" + payload + "\""));
        return index;
    }

  private:
    boost::asio::io_context      io_context_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::streambuf       buffer_;
};

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
