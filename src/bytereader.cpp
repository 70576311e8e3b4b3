/**
 * @file bytereader.cpp
 * @brief ByteReader compilation unit.
 *
 * This file exists for library structure purposes. ByteReader is
 * implemented entirely in the header so field reads inline into the
 * decoder.
 *
 * @see include/vif2csv/bytereader.hpp for the full implementation
 */

#include <vif2csv/bytereader.hpp>

// All implementation is in the header (inline functions)
