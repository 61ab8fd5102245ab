#include "ydecode/rapidyenc-gateway.hpp"

#include <yencode/crc.h>
#include <yencode/decoder.h>
#include <yencode/encoder.h>

namespace ydecode {

void InitRapidYenc() {
  [[maybe_unused]] static const bool kInitialized = [] {
    RapidYenc::encoder_init();
    RapidYenc::decoder_init();
    RapidYenc::crc32_init();
    return true;
  }();
}

}  // namespace ydecode
