/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

/*
**  This code is based on "A simple fast memory allocation package"
**  by Steve Hill in Graphics Gems III, David Kirk (ed.),
**  Academic Press, Boston, MA, 1992
*/

#include "mempool.h"
#include "Core/error.h"

#include <new>

/*
**  ALLOC_BLOCK_SIZE - large enough to hold a few hundred network
**  elements so that blocks are seldom chained.
*/

static const std::size_t ALLOC_BLOCK_SIZE = 64000;
static const std::size_t ALIGNMENT = alignof(std::max_align_t);

struct MemBlock
{
    MemBlock* next;    /* Next Block          */
    char*     block;   /* Start of block      */
    char*     free;    /* Next free in block  */
    char*     end;     /* block + block size  */
};

static MemBlock* createMemBlock()
{
    MemBlock* memBlock = new MemBlock;
    memBlock->block = new char[ALLOC_BLOCK_SIZE];
    memBlock->free = memBlock->block;
    memBlock->next = nullptr;
    memBlock->end = memBlock->block + ALLOC_BLOCK_SIZE;
    return memBlock;
}

static void deleteMemBlock(MemBlock* memBlock)
{
    delete [] memBlock->block;
    delete memBlock;
}

//-----------------------------------------------------------------------------

// MemPool Constructor

MemPool::MemPool() :
    first(nullptr),
    current(nullptr),
    used(0)
{
    first = createMemBlock();
    current = first;
}

// MemPool Destructor

MemPool::~MemPool()
{
    while (first)
    {
        current = first->next;
        deleteMemBlock(first);
        first = current;
    }
}

//-----------------------------------------------------------------------------

/*
**  alloc()
**
**  Returns a block of memory of the requested size, aligned for any
**  object type. Throws a SystemError if the request cannot be met.
*/

char* MemPool::alloc(std::size_t size)
{
    size = (size + ALIGNMENT - 1) & ~(ALIGNMENT - 1);
    if ( size > ALLOC_BLOCK_SIZE )
    {
        throw SystemError(SystemError::OUT_OF_MEMORY);
    }

    if ( current->free + size > current->end )
    {
        // ... re-use a block left over from a reset() or chain a new one
        if ( current->next == nullptr )
        {
            try
            {
                current->next = createMemBlock();
            }
            catch (std::bad_alloc&)
            {
                throw SystemError(SystemError::OUT_OF_MEMORY);
            }
        }
        current = current->next;
        current->free = current->block;
    }

    char* ptr = current->free;
    current->free += size;
    used += size;
    return ptr;
}

//-----------------------------------------------------------------------------

/*
**  reset()
**
**  Reset the pool for re-use.  No memory is freed,
**  so this is very fast.
*/

void MemPool::reset()
{
    current = first;
    current->free = current->block;
    used = 0;
}
