//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PROXYPROTO_SRC_COROUTINE_HPP
#define PROXYPROTO_SRC_COROUTINE_HPP

// Stackless coroutine helpers for the FSMs. Use within a switch on an int resume point,
// which must be initialized to zero.
#define PROXYPROTO_CORO_INITIAL case 0:

#define PROXYPROTO_YIELD(resume_point_var, resume_point_id, ...) \
    {                                                            \
        resume_point_var = resume_point_id;                      \
        return __VA_ARGS__;                                      \
    case resume_point_id:                                        \
    {                                                            \
    }                                                            \
    }

#endif
