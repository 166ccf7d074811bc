#include "cli/application.hpp"

int main(int argc, char** argv)
{
    return dfcompress::cli::run(argc, argv);
}
