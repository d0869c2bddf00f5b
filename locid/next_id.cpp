/**
 * next_id: print the next free location identifier (L<N>) for the data files
 * under a directory.
 */

#include <iostream>
#include "cli.hpp"

int main(int argc, char** argv)
{
    return run_next_id(argc, argv, std::cout, std::cerr);
}
