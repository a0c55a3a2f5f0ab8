#include "app/CleanerApp.hpp"

int main(int argc, char** argv)
{
    return app::CleanerApp{ argc, argv }.run();
}
