/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file mempool.h
//! \brief A simple pooled memory allocator.

#ifndef MEMPOOL_H_
#define MEMPOOL_H_

#include <cstddef>

struct MemBlock;

//! \class MemPool
//! \brief Allocates network element storage in large blocks.
//!
//! Objects are placement-new'ed into memory handed out by alloc() and are
//! never freed individually. The whole pool is released (or reset) at once.

class MemPool
{
  public:
    MemPool();
    ~MemPool();

    char* alloc(std::size_t size);
    void  reset();

    std::size_t bytesUsed() const { return used; }

  private:
    MemBlock*   first;
    MemBlock*   current;
    std::size_t used;
};

#endif
