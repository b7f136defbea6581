//  status.cpp -- unit tests for status decoding
//  Copyright (C) 2026  Insatsu contributors
//
//  License: GPL-3.0+
//
//  This file is part of the 'Insatsu' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <sstream>

#include <boost/test/unit_test.hpp>

#include "../status.hpp"

using namespace insatsu::_drv_::escpos;

namespace {

status
make_status (unsigned flags)
{
  status rv;
  for (unsigned bit = 1; bit <= status::PAPER_END; bit <<= 1)
    {
      if (bit & flags)
        rv.insert (status::condition (bit));
    }
  return rv;
}

}       // namespace

BOOST_AUTO_TEST_SUITE (status_block)

BOOST_AUTO_TEST_CASE (offline_door_open)
{
  const byte data[16] = { 0x28, 0x00, 0x00 };

  status s (status::decode (data, sizeof (data), status::block_rules ()));

  BOOST_CHECK_EQUAL (make_status (status::OFFLINE | status::DOOR_OPEN), s);
  BOOST_CHECK_EQUAL (2, s.size ());
  BOOST_CHECK (s.is_fault ());
}

BOOST_AUTO_TEST_CASE (all_clear)
{
  const byte data[16] = { 0x00 };

  status s (status::decode (data, sizeof (data), status::block_rules ()));

  BOOST_CHECK_EQUAL (make_status (status::ONLINE), s);
  BOOST_CHECK (!s.is_fault ());
}

BOOST_AUTO_TEST_CASE (every_flag)
{
  const byte data[16] = { 0x68, 0x68, 0x0f };

  status s (status::decode (data, sizeof (data), status::block_rules ()));

  BOOST_CHECK_EQUAL (make_status (status::OFFLINE
                                  | status::DOOR_OPEN
                                  | status::PAPER_FEED
                                  | status::AUTO_CUTTER
                                  | status::RECOVERABLE
                                  | status::AUTOMATICALLY_RECOVERABLE
                                  | status::PAPER_NEAR_END
                                  | status::PAPER_END), s);
}

BOOST_AUTO_TEST_CASE (paper_fields_need_both_bits)
{
  const byte half[16]  = { 0x00, 0x00, 0x05 };
  const byte near[16]  = { 0x00, 0x00, 0x03 };
  const byte empty[16] = { 0x00, 0x00, 0x0c };

  status s;

  s = status::decode (half, sizeof (half), status::block_rules ());
  BOOST_CHECK (!s.contains (status::PAPER_NEAR_END));
  BOOST_CHECK (!s.contains (status::PAPER_END));

  s = status::decode (near, sizeof (near), status::block_rules ());
  BOOST_CHECK (s.contains (status::PAPER_NEAR_END));
  BOOST_CHECK (!s.contains (status::PAPER_END));

  s = status::decode (empty, sizeof (empty), status::block_rules ());
  BOOST_CHECK (!s.contains (status::PAPER_NEAR_END));
  BOOST_CHECK (s.contains (status::PAPER_END));
}

BOOST_AUTO_TEST_CASE (byte_three_unused)
{
  const byte data[16] = { 0x00, 0x00, 0x00, '\xff' };

  status s (status::decode (data, sizeof (data), status::block_rules ()));

  BOOST_CHECK_EQUAL (make_status (status::ONLINE), s);
}

BOOST_AUTO_TEST_CASE (short_block)
{
  const byte data[1] = { 0x20 };

  status s (status::decode (data, sizeof (data), status::block_rules ()));

  BOOST_CHECK_EQUAL (make_status (status::ONLINE | status::DOOR_OPEN), s);
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_SUITE (status_polls)

BOOST_AUTO_TEST_CASE (every_flag)
{
  const byte data[4] = { 0x08, 0x24, 0x08, 0x00 };

  status s (status::decode (data, sizeof (data), status::poll_rules ()));

  BOOST_CHECK_EQUAL (make_status (status::OFFLINE
                                  | status::DOOR_OPEN
                                  | status::PAPER_END
                                  | status::AUTO_CUTTER), s);
}

BOOST_AUTO_TEST_CASE (all_clear)
{
  const byte data[4] = { 0x12, 0x12, 0x12, 0x12 };

  status s (status::decode (data, sizeof (data), status::poll_rules ()));

  BOOST_CHECK (s.empty ());
  BOOST_CHECK (!s.is_fault ());
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_AUTO_TEST_SUITE (conditions)

BOOST_AUTO_TEST_CASE (empty_by_default)
{
  status s;

  BOOST_CHECK (s.empty ());
  BOOST_CHECK_EQUAL (0, s.size ());
  BOOST_CHECK (s.conditions ().empty ());
}

BOOST_AUTO_TEST_CASE (declaration_order)
{
  status s;

  s.insert (status::PAPER_END);
  s.insert (status::COMMUNICATION);
  s.insert (status::DOOR_OPEN);

  std::vector< status::condition > v (s.conditions ());

  BOOST_REQUIRE_EQUAL (3, v.size ());
  BOOST_CHECK_EQUAL (status::COMMUNICATION, v[0]);
  BOOST_CHECK_EQUAL (status::DOOR_OPEN, v[1]);
  BOOST_CHECK_EQUAL (status::PAPER_END, v[2]);
}

BOOST_AUTO_TEST_CASE (insert_is_idempotent)
{
  status s;

  s.insert (status::OFFLINE);
  s.insert (status::OFFLINE);

  BOOST_CHECK_EQUAL (1, s.size ());
}

BOOST_AUTO_TEST_CASE (stream_output)
{
  std::ostringstream os;

  os << make_status (status::OFFLINE | status::PAPER_NEAR_END);

  BOOST_CHECK_EQUAL ("{offline, paper near end}", os.str ());
}

BOOST_AUTO_TEST_CASE (communication_is_fault)
{
  status s;

  s.insert (status::COMMUNICATION);

  BOOST_CHECK (s.is_fault ());
}

BOOST_AUTO_TEST_SUITE_END ()

#include "insatsu/test/runner.ipp"
