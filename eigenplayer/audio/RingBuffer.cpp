#include "audio/RingBuffer.hpp"

namespace EigenPlayer {

// Sample ring shared by the decoder and output threads
template class RingBuffer<float>;

} // namespace EigenPlayer
