#pragma once
#include "byte_order.hpp"
#include "binary_reader.hpp"
#include "binary_writer.hpp"
#include "utf8.hpp"

namespace binio {

// Earlier name of BinaryReader
using BinarySeeker [[deprecated("use BinaryReader")]] = BinaryReader;

} // namespace binio
