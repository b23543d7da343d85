/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include <sycl/ext/intel/fpga_extensions.hpp>
#include <sycl/sycl.hpp>
#include <iostream>
#include "../include/Device.hpp"

// surface kernel failures on the host thread at the next wait_and_throw
static void asyncHandler(sycl::exception_list exceptions)
{
    for(const std::exception_ptr &e : exceptions)
    {
        std::rethrow_exception(e);
    }
}

sycl::queue makeQueue(bool verbose)
{
    auto property_list = sycl::property_list{sycl::property::queue::enable_profiling(), sycl::property::queue::in_order()};

    //Device selection
    //We will explicitly compile for the FPGA_EMULATOR, FPGA_HARDWARE, CPU_HOST, or the default device
    #if defined(FPGA_EMULATOR)
      auto device_selector = sycl::ext::intel::fpga_emulator_selector_v;
      if(verbose){std::cout << "FPGA Emulator Selected!" << std::endl;}
    #elif defined(FPGA_HARDWARE)
      auto device_selector = sycl::ext::intel::fpga_selector_v;
      if(verbose){std::cout << "FPGA Selected!" << std::endl;}
    #elif defined(CPU_HOST)
      auto device_selector = sycl::cpu_selector_v;
      if(verbose){std::cout << "CPU Selected!" << std::endl;}
    #else
      auto device_selector = sycl::default_selector_v;
      if(verbose){std::cout << "Default Device Selected!" << std::endl;}
    #endif

    //Create queue
    sycl::queue device_queue(device_selector, asyncHandler, property_list);

    //Query platform and device
    if(verbose)
    {
        sycl::platform platform = device_queue.get_context().get_platform();
        sycl::device device = device_queue.get_device();
        std::cout << "Platform name: " <<  platform.get_info<sycl::info::platform::name>().c_str() << std::endl;
        std::cout << "Device name: " <<  device.get_info<sycl::info::device::name>().c_str() << std::endl;
    }

    return device_queue;
}
