#pragma once

// TRE Archive Library
// A C++20 library for reading, verifying and building TRE resource archives:
// many named, individually compressed and checksummed blobs in one file.

#include "archive.hpp"
#include "builder.hpp"
#include "byte_source.hpp"
#include "checksum.hpp"
#include "compression.hpp"
#include "diff.hpp"
#include "error.hpp"
#include "log.hpp"
#include "mmap.hpp"
#include "reader.hpp"
#include "types.hpp"

// The library provides two levels of abstraction:
//
// 1. Low-level: Reader / Builder classes
//    - Reader::open() parses an archive from any ByteSource (MemorySource, MappedFile)
//    - Builder accumulates entries and finalize() returns the archive bytes
//
// 2. High-level: Archive class
//    - Archive::open() maps a file from disk, Archive::create() starts a new one
//    - Archive::write() replaces the destination atomically
//
// Example usage:
//
//   // Reading an archive
//   tre::Error error;
//   auto archive = tre::Archive::open("textures.tre", &error);
//   if (archive) {
//     for (const auto &entry : archive->entries()) {
//       std::cout << entry.name << std::endl;
//     }
//     if (const auto *entry = archive->findEntry("texture/grass.dds")) {
//       auto bytes = archive->extract(*entry, &error);
//     }
//   }
//
//   // Creating a new archive
//   auto archive = tre::Archive::create();
//   archive.addFile("grass.dds", "texture/grass.dds");
//   archive.write("textures.tre");

namespace tre {}
