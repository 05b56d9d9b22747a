// RHI.Vma.cpp - plain TU (no module declaration) hosting the VMA implementation.

#include <cstdlib>
#include <cstdio>

#define VK_NO_PROTOTYPES
#include <volk.h>

// Must match every other inclusion of vk_mem_alloc.h (functions come from volk).
#define VMA_IMPLEMENTATION
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1

#include <vk_mem_alloc.h>
