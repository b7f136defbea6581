//  status.cpp -- printer condition flags and their decoding
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

#include "status.hpp"

namespace insatsu {
namespace _drv_ {
namespace escpos {

namespace {

const status::condition all_conditions[] = {
  status::COMMUNICATION,
  status::ONLINE,
  status::OFFLINE,
  status::DOOR_OPEN,
  status::PAPER_FEED,
  status::AUTO_CUTTER,
  status::RECOVERABLE,
  status::AUTOMATICALLY_RECOVERABLE,
  status::PAPER_NEAR_END,
  status::PAPER_END,
};

const status::rule block_table[] = {
  { 0, 0x08, 0x08, status::OFFLINE, status::ONLINE },
  { 0, 0x20, 0x20, status::DOOR_OPEN, 0 },
  { 0, 0x40, 0x40, status::PAPER_FEED, 0 },
  { 1, 0x08, 0x08, status::AUTO_CUTTER, 0 },
  { 1, 0x20, 0x20, status::RECOVERABLE, 0 },
  { 1, 0x40, 0x40, status::AUTOMATICALLY_RECOVERABLE, 0 },
  { 2, 0x03, 0x03, status::PAPER_NEAR_END, 0 },
  { 2, 0x0c, 0x0c, status::PAPER_END, 0 },
};

const status::rule poll_table[] = {
  { 0, 0x08, 0x08, status::OFFLINE, 0 },
  { 1, 0x04, 0x04, status::DOOR_OPEN, 0 },
  { 1, 0x20, 0x20, status::PAPER_END, 0 },
  { 2, 0x08, 0x08, status::AUTO_CUTTER, 0 },
};

#define TABLE(array) \
  std::vector< status::rule > (array, array + sizeof (array) / sizeof (*array))

}       // namespace

status::status ()
  : flags_(0)
{}

bool
status::empty () const
{
  return !flags_;
}

streamsize
status::size () const
{
  return conditions ().size ();
}

bool
status::contains (condition c) const
{
  return c & flags_;
}

bool
status::is_fault () const
{
  return ~ONLINE & flags_;
}

void
status::insert (condition c)
{
  flags_ |= c;
}

std::vector< status::condition >
status::conditions () const
{
  std::vector< condition > rv;
  const int count = sizeof (all_conditions) / sizeof (*all_conditions);

  for (int i = 0; i < count; ++i)
    {
      if (contains (all_conditions[i]))
        rv.push_back (all_conditions[i]);
    }
  return rv;
}

bool
status::operator== (const status& that) const
{
  return flags_ == that.flags_;
}

bool
status::operator!= (const status& that) const
{
  return !(*this == that);
}

status
status::decode (const byte *data, streamsize size,
                const std::vector< rule >& table)
{
  status rv;

  std::vector< rule >::const_iterator it;
  for (it = table.begin (); table.end () != it; ++it)
    {
      if (size <= it->index) continue;

      if ((data[it->index] & it->mask) == it->value)
        rv.flags_ |= it->flag;
      else
        rv.flags_ |= it->otherwise;
    }
  return rv;
}

const std::vector< status::rule >&
status::block_rules ()
{
  static const std::vector< rule > rules (TABLE (block_table));
  return rules;
}

const std::vector< status::rule >&
status::poll_rules ()
{
  static const std::vector< rule > rules (TABLE (poll_table));
  return rules;
}

#undef TABLE

std::string
status::name (condition c)
{
  switch (c)
    {
    case COMMUNICATION            : return "communication failure";
    case ONLINE                   : return "online";
    case OFFLINE                  : return "offline";
    case DOOR_OPEN                : return "door open";
    case PAPER_FEED               : return "paper feed";
    case AUTO_CUTTER              : return "auto-cutter error";
    case RECOVERABLE              : return "recoverable error";
    case AUTOMATICALLY_RECOVERABLE: return "automatically recoverable error";
    case PAPER_NEAR_END           : return "paper near end";
    case PAPER_END                : return "paper end";
    }
  return "unknown condition";
}

std::ostream&
operator<< (std::ostream& os, const status& s)
{
  std::vector< status::condition > v (s.conditions ());

  os << "{";
  for (std::vector< status::condition >::size_type i = 0; i < v.size (); ++i)
    {
      os << (i ? ", " : "") << status::name (v[i]);
    }
  os << "}";
  return os;
}

} // namespace escpos
} // namespace _drv_
} // namespace insatsu
