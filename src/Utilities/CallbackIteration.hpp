//----------------------------------------------------------------------------------------------------------------------
// File: CallbackIteration.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

enum class CallbackIteration : std::uint32_t { Continue, Stop };

//----------------------------------------------------------------------------------------------------------------------
