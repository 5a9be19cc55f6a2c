// ------------------------------------------------------------------------
#ifndef WINDOWED_TFTP_WINDOW_HPP
#define WINDOWED_TFTP_WINDOW_HPP
// ------------------------------------------------------------------------
#include "common.hpp"
#include <deque>
#include <fstream>
#include <vector>
// ------------------------------------------------------------------------
namespace wtftp
{
   /// Blocks that are in flight: read from the file but not yet acknowledged (sending),
   /// or received but not yet written to the file (receiving).
   /// The window owns the file, both are released together.
   class Window
   {
      std::deque<std::vector<unsigned char>> chunks;
      uint16_t maxSize;
      size_t blockSize;
      std::fstream file;
      bool endOfFile = false;

    public:
      Window(uint16_t maxSize, size_t blockSize, std::fstream file);

      /// Reads blocks until the window is full or the file is exhausted.
      /// Returns true once the end of the file was reached; the last chunk is then shorter than blockSize.
      bool fill();

      /// Throws std::length_error if the window is full
      void add(std::vector<unsigned char> chunk);

      /// Drops the n oldest chunks, throws std::out_of_range if fewer are held
      void remove(size_t n);

      /// Writes every chunk to the file in order and clears the window
      void empty();

      bool is_full() const { return chunks.size() >= maxSize; }
      bool is_empty() const { return chunks.empty(); }
      size_t size() const { return chunks.size(); }

      const std::deque<std::vector<unsigned char>>& get_elements() const { return chunks; }
   };
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_WINDOW_HPP
// ------------------------------------------------------------------------
