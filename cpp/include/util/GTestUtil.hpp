#pragma once

#include <gtest/gtest.h>

/*
 * Dispatches to the standard gtest main function, while adding the util::Logging cmdline params.
 *
 * Every unit-test executable has the same main():
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 */
int launch_gtest(int argc, char** argv);
