// ------------------------------------------------------------------------
#include "Window.hpp"
#include <cerrno>
#include <stdexcept>
#include <system_error>
// ------------------------------------------------------------------------
namespace wtftp
{
   // ------------------------------------------------------------------------
   Window::Window(const uint16_t maxSize, const size_t blockSize, std::fstream file)
       : maxSize(maxSize), blockSize(blockSize), file(std::move(file)) {}
   // ------------------------------------------------------------------------
   bool Window::fill()
   {
      while (!endOfFile && chunks.size() < maxSize) {
         std::vector<unsigned char> chunk(blockSize);
         file.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(blockSize));
         if (file.bad()) {
            throw std::system_error(errno, std::generic_category(), "Could not read from file");
         }

         const size_t numBytesRead = file.gcount();
         // Read the last chunk of the file
         if (numBytesRead < blockSize) {
            chunk.resize(numBytesRead);
            endOfFile = true;
         }
         chunks.push_back(std::move(chunk));
      }

      return endOfFile;
   }
   // ------------------------------------------------------------------------
   void Window::add(std::vector<unsigned char> chunk)
   {
      if (is_full()) {
         throw std::length_error("Window is full (" + std::to_string(maxSize) + " chunks)");
      }
      chunks.push_back(std::move(chunk));
   }
   // ------------------------------------------------------------------------
   void Window::remove(const size_t n)
   {
      if (n > chunks.size()) {
         throw std::out_of_range("Cannot remove " + std::to_string(n) + " of " + std::to_string(chunks.size()) + " chunks");
      }
      chunks.erase(chunks.begin(), chunks.begin() + static_cast<std::ptrdiff_t>(n));
   }
   // ------------------------------------------------------------------------
   void Window::empty()
   {
      for (const auto& chunk: chunks) {
         file.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));

         // No space left
         if (!file) {
            throw std::system_error(errno, std::generic_category(), "Could not write to file");
         }
      }
      file.flush();
      if (!file) {
         throw std::system_error(errno, std::generic_category(), "Could not write to file");
      }

      chunks.clear();
   }
   // ------------------------------------------------------------------------
}// namespace wtftp
// ------------------------------------------------------------------------
