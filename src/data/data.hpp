#ifndef HERMES_DATA_HPP
#define HERMES_DATA_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/dataset.hpp"
#include "details/partition.hpp"
#include "details/cursor.hpp"
#endif //HERMES_DATA_HPP
