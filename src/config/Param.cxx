// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Param.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <exception>

void
ConfigParam::ThrowWithNested() const
{
	std::throw_with_nested(FmtRuntimeError("Error on line {}", line));
}
