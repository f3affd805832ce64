/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <iostream>

#include "Cli.hpp"

int main(int Argc, char** Argv)
{
	WCliOptions Options{};
	std::string Error{};
	if (!WCli::ParseArgs(Argc, Argv, Options, Error))
	{
		std::cerr << Error << "\nsee weiche --help\n";
		return 1;
	}
	return WCli(std::cout, std::cerr).Run(Options);
}
