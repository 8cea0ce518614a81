#include "RunReport.hpp"
#include "Logger.hpp"

void RunReport::AddError(const std::string& Message)
{
    Log.Error(Message);
    Errors.push_back(Message);
}

bool RunReport::IsEmpty() const
{
    return Transferred.empty() && Deleted.empty() && Errors.empty();
}
