/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_SJSON_HPP
#define SJSON_SJSON_HPP

#pragma once
#include <sjson/config.hpp>
#include <sjson/error.hpp>
#include <sjson/detail/scan.hpp>
#include <sjson/detail/utf8.hpp>
#include <sjson/detail/pow5_table.hpp>
#include <sjson/detail/stack.hpp>
#include <sjson/detail/bigint.hpp>
#include <sjson/number.hpp>
#include <sjson/sink.hpp>
#include <sjson/string.hpp>
#include <sjson/pointer.hpp>
#include <sjson/parser.hpp>
#include <sjson/arena.hpp>
#include <sjson/value.hpp>
#include <sjson/writer.hpp>
#include <sjson/lazy.hpp>

#endif // SJSON_SJSON_HPP
