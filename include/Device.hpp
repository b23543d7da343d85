#ifndef DEVICE_H
#define DEVICE_H

#include <sycl/sycl.hpp>

// in order, profiling enabled queue on the compiled-in device
// (FPGA_EMULATOR, FPGA_HARDWARE, CPU_HOST or the default device)
sycl::queue makeQueue(bool verbose);

#endif /* DEVICE_H */
