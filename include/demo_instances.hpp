#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>


///////////////////////////
///    DEMO INSTANCES   ///
///////////////////////////
/**
 * @brief Sizes of the built-in synthetic instances.
 */
enum class DemoSize { XS, S, M, L, XL };

/**
 * @brief Build a deterministic synthetic instance of the requested size.
 */
ProblemDescription makeDemoInstance(DemoSize size);

/**
 * @brief Parse a size label ("XS", "S", "M", "L", "XL").
 *
 * @throws std::invalid_argument for unknown labels.
 */
DemoSize parseDemoSize(const std::string& label);
