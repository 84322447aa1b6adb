/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file evmux.hpp
 * @brief evmux - single-threaded event-driven TCP connection multiplexer
 *
 * One poll() reactor owns a listening socket and every accepted client.
 * Readiness is dispatched to a closed set of handlers (acceptor, connection)
 * kept in a registration table; the protocol layer plugs in through three
 * callbacks that run on the loop thread.
 *
 * Usage:
 *   #include "evmux.hpp"
 *
 *   int main() {
 *     evmux::EventLoop loop(evmux::LoopConfig().set_port(50007),
 *                           evmux::make_upper_echo_callbacks());
 *     evmux::StopSignalGuard signals(loop);
 *     return loop.run() ? 0 : 1;
 *   }
 */

#ifndef EVMUX_HPP_
#define EVMUX_HPP_

#include "evmux/acceptor.hpp"
#include "evmux/callbacks.hpp"
#include "evmux/config.hpp"
#include "evmux/connection.hpp"
#include "evmux/event_loop.hpp"
#include "evmux/handler.hpp"
#include "evmux/log.hpp"
#include "evmux/loop_stats.hpp"
#include "evmux/poller.hpp"
#include "evmux/registration_table.hpp"
#include "evmux/selector.hpp"
#include "evmux/signal_guard.hpp"
#include "evmux/upper_echo.hpp"
#include "evmux/vocabulary.hpp"

#endif  // EVMUX_HPP_
