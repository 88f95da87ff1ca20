#include <hetfeat/mpi_helper.hpp>

#include <exception>
#include <string>

namespace
{

void broadcast_from_master(void* data, int count, MPI_Datatype data_type)
{
    if (MPI_Bcast(data, count, data_type, 0, MPI_COMM_WORLD) != MPI_SUCCESS)
    {
        throw std::runtime_error("MPI_Bcast failed");
    }
}

} // namespace

hetfeat::MPI_Instance::MPI_Instance(int* argc, char*** argv)
{
    constexpr int required_thread_support = MPI_THREAD_FUNNELED;
    int provided_thread_support = MPI_THREAD_SINGLE;
    MPI_Init_thread(argc, argv, required_thread_support, &provided_thread_support);
    if (provided_thread_support < required_thread_support)
    {
        MPI_Finalize();
        throw std::runtime_error("MPI library does not provide MPI_THREAD_FUNNELED");
    }
}

int hetfeat::get_mpi_rank()
{
    int a;
    MPI_Comm_rank(MPI_COMM_WORLD, &a);
    return a;
}

int hetfeat::get_mpi_size()
{
    int a;
    MPI_Comm_size(MPI_COMM_WORLD, &a);
    return a;
}

bool hetfeat::is_master_process() { return get_mpi_rank() == 0; }

void hetfeat::run_on_master(std::function<void()> const& func)
{
    std::exception_ptr error;
    std::string message;
    if (is_master_process())
    {
        try
        {
            func();
        }
        catch (std::exception const& e)
        {
            error = std::current_exception();
            message = e.what();
        }
    }

    int failed = error ? 1 : 0;
    broadcast_from_master(&failed, 1, MPI_INT);
    if (!failed)
    {
        return;
    }

    int length = static_cast<int>(message.size());
    broadcast_from_master(&length, 1, MPI_INT);
    message.resize(length);
    broadcast_from_master(&message[0], length, MPI_CHAR);
    if (error)
    {
        std::rethrow_exception(error);
    }
    throw std::runtime_error(message);
}
