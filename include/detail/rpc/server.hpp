// Copyright (c) 2009-2016 Craig Henderson
// https://github.com/cdmh/mapreduce

#pragma once

#include <iostream>
#include <memory>
#include <thread>
#include <boost/asio.hpp>

namespace medreduce {

namespace rpc {

// Runs one request line against the coordinator and returns the response
// line. Lease failures come back as typed errors; nothing thrown by a single
// call reaches the listener.
inline std::string const dispatch(coordinator &coord, std::string const &line)
{
    request req;
    if (!parse_request(line, req))
        return format_failure(bad_request_error, "malformed request \"" + line + "\"");

    try
    {
        if (req.method == assign_map_task_method)
            return format_success(std::to_string(coord.assign_map_task(req.args)));
        else if (req.method == assign_reduce_task_method)
            return format_success(std::to_string(coord.assign_reduce_task(req.args)));
        else if (req.method == done_method)
            return format_success(coord.done(req.args));
    }
    catch (no_tasks_available &e)
    {
        return format_failure(no_tasks_available_error, e.what());
    }
    catch (std::exception &e)
    {
        std::cerr << "\nError: " << req.method << ": " << e.what() << "\n";
        return format_failure(internal_error, e.what());
    }

    return format_failure(bad_request_error, "unknown method " + req.method);
}

namespace detail {

class session : public std::enable_shared_from_this<session>
{
  public:
    session(boost::asio::ip::tcp::socket socket, coordinator &coord)
      : socket_(std::move(socket)),
        coordinator_(coord)
    {
    }

    void start()
    {
        read_request();
    }

  private:
    void read_request()
    {
        auto self(shared_from_this());
        boost::asio::async_read_until(
            socket_,
            buffer_,
            '\n',
            [this, self](boost::system::error_code const &ec, std::size_t)
            {
                // eof or reset; the caller has gone
                if (ec)
                    return;

                std::istream in(&buffer_);
                std::string line;
                std::getline(in, line);
                reply_ = dispatch(coordinator_, line);
                write_response();
            });
    }

    void write_response()
    {
        auto self(shared_from_this());
        boost::asio::async_write(
            socket_,
            boost::asio::buffer(reply_),
            [this, self](boost::system::error_code const &ec, std::size_t)
            {
                if (!ec)
                    read_request();
            });
    }

  private:
    boost::asio::ip::tcp::socket socket_;
    boost::asio::streambuf       buffer_;
    std::string                  reply_;
    coordinator                 &coordinator_;
};

}   // namespace detail

// Listens for callers of the coordinator on a thread of its own, from
// construction until stop() or destruction. Any number of connections, each
// carrying any number of requests.
class server : ::medreduce::detail::noncopyable
{
  public:
    server(coordinator &coord, std::string const &address, unsigned short const port)
      : coordinator_(coord),
        acceptor_(
            io_context_,
            boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address(address), port))
    {
        accept();
        thread_ = std::thread([this] { io_context_.run(); });
    }

    ~server()
    {
        stop();
    }

    // the bound port, useful when constructed with port 0
    unsigned short const port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void stop()
    {
        io_context_.stop();
        if (thread_.joinable())
            thread_.join();
    }

  private:
    void accept()
    {
        acceptor_.async_accept(
            [this](boost::system::error_code const &ec, boost::asio::ip::tcp::socket socket)
            {
                if (ec == boost::asio::error::operation_aborted)
                    return;

                if (ec)
                    std::cerr << "\nError: accept failed: " << ec.message() << "\n";
                else
                    std::make_shared<detail::session>(std::move(socket), coordinator_)->start();

                accept();
            });
    }

  private:
    coordinator                    &coordinator_;
    boost::asio::io_context         io_context_;
    boost::asio::ip::tcp::acceptor  acceptor_;
    std::thread                     thread_;
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
