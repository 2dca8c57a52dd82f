#include "minitest.hpp"

int main() { return mini::run_all(); }
